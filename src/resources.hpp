#pragma once

#include <httpserver.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "bin_lookup.hpp"
#include "core/generation.hpp"
#include "core/results.hpp"
#include "monitors/activity_monitor.hpp"

namespace resources
{
    using httpserver::http_resource;
    using httpserver::http_response;
    using httpserver::http_request;

    template<class T>
    using Ref = std::shared_ptr<T>;

    /**
     * State shared by every request. The results collection and the generator
     * are only touched with `mutex` held; the lookup client is stateless and
     * is called without it so a slow lookup never blocks other requests.
     */
    /**
     * Upper bound on the lines the shared results collection holds. Once it
     * is reached /generate is refused until the results are cleared with
     * DELETE /results.
     */
    constexpr std::size_t max_result_lines = 10000;

    struct Workspace
    {
        std::mutex mutex;
        results::ResultsCollection results;
        generation::CardGenerator generator;
        std::unique_ptr<bin_lookup::BinLookup> lookup;

        Workspace(generation::CardGenerator gen, std::unique_ptr<bin_lookup::BinLookup> lookup_client)
            : results(max_result_lines), generator(std::move(gen)), lookup(std::move(lookup_client))
        {}
    };

    class card_resource : public http_resource
    {
        const std::string p_endpoint;
        const bool p_family;
        Ref<Workspace> p_workspace;
        Ref<ActivityLog> p_activity;
    public:
        card_resource(std::string endpoint, bool family, Ref<Workspace> workspace, Ref<ActivityLog> activity)
            : p_endpoint(std::move(endpoint)), p_family(family), p_workspace(std::move(workspace)), p_activity(std::move(activity)) {}

        [[nodiscard]] inline const std::string& endpoint() const noexcept { return p_endpoint; }
        [[nodiscard]] inline bool family() const noexcept { return p_family; }
        [[nodiscard]] inline Workspace& workspace() const noexcept { return *p_workspace; }

        inline void record(const http_request& req, Activity activity, std::string detail)
        {
            p_activity->queue.push(ActivityData { req.get_requestor(), activity, std::move(detail) });
        }

        const Ref<http_response> reject(const http_request& req, const std::string& msg, int code);
    };

    #define CARD_RESOURCE(name, method, endpoint, family) class name : public card_resource   \
    {                                                                                        \
    public:                                                                                  \
        name(const Ref<Workspace>& workspace, const Ref<ActivityLog>& activity) :            \
            card_resource(endpoint, family, workspace, activity)                             \
        {}                                                                                   \
                                                                                             \
        const Ref<http_response> method(const http_request& req) override                    \
        {                                                                                    \
            return process(req);                                                             \
        }                                                                                    \
                                                                                             \
        const Ref<http_response> process(const http_request& req);                           \
    }

    CARD_RESOURCE(classify_card, render_GET, "/classify", false);
    CARD_RESOURCE(generate_cards, render, "/generate", false);
    CARD_RESOURCE(validate_cards, render, "/validate", false);
    CARD_RESOURCE(results_list, render, "/results", false);
    CARD_RESOURCE(bin_info, render_GET, "/bin", true);

    Ref<http_response> make_xml_error(const std::string& msg, int code);

    std::vector<Ref<card_resource>> resources(const Ref<Workspace>& workspace, const Ref<ActivityLog>& activity);
}
