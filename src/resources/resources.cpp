#include "resources.hpp"
#include <spdlog/spdlog.h>

#include "helpers/xml_builder.hpp"

namespace resources
{
    std::vector<Ref<card_resource>> resources(const Ref<Workspace>& workspace, const Ref<ActivityLog>& activity)
    {
        return {
            std::make_shared<classify_card>(workspace, activity),
            std::make_shared<generate_cards>(workspace, activity),
            std::make_shared<validate_cards>(workspace, activity),
            std::make_shared<results_list>(workspace, activity),
            std::make_shared<bin_info>(workspace, activity)
        };
    }

    Ref<http_response> make_xml_error(const std::string& msg, int code)
    {
        using ::httpserver::string_response;

        XmlBuilder b;
        b
            .add_child("Data")
                .add_string("Error", msg);

        return std::make_shared<string_response>(b.serialize(), code, "application/xml");
    }

    const Ref<http_response> card_resource::reject(const http_request& req, const std::string& msg, int code)
    {
        spdlog::debug("Rejecting {} {}: {}", req.get_method(), req.get_path(), msg);
        record(req, Activity::Rejected, msg);
        return make_xml_error(msg, code);
    }
}
