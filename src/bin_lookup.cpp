#include "bin_lookup.hpp"

#include <memory>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace bin_lookup
{
    std::string summarize(const std::string_view& body)
    {
        auto data = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
        if (data.is_discarded() || !data.is_object())
            throw BinLookupError("lookup response is not a JSON object");

        auto get_or_default = [](const nlohmann::json& j, const char* name, const char* default_val) -> std::string
        {
            if (!j.is_object() || !j.contains(name) || !j[name].is_string())
                return default_val;

            return j[name].get<std::string>();
        };

        auto nested = [&data](const char* name) -> nlohmann::json
        {
            if (data.contains(name) && data[name].is_object())
                return data[name];
            return nlohmann::json::object();
        };

        auto bank_name = get_or_default(nested("bank"), "name", "Unknown Bank");
        auto country = get_or_default(nested("country"), "name", "Unknown Country");
        auto card_type = get_or_default(data, "type", "Unknown Type");
        auto scheme = get_or_default(data, "scheme", "Unknown Scheme");

        return "BIN Info: " + bank_name + " (" + country + ") - " + card_type + " " + scheme;
    }

    static size_t store_body(char* data, size_t size, size_t nmemb, std::string* body)
    {
        if (body == nullptr)
            return 0;
        body->append(data, size * nmemb);
        return size * nmemb;
    }

    std::string HttpBinLookup::get(const std::string& url, long& http_code) const
    {
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl)
            throw BinLookupError("curl_easy_init() failed");

        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers{
            curl_slist_append(nullptr, "Accept-Version: 3"), &curl_slist_free_all};
        if (!headers)
            throw BinLookupError("curl_slist_append() failed");

        std::string body;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, store_body);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        if (p_timeout > 0)
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, p_timeout);

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK)
            throw BinLookupError("curl_easy_perform() failed: " + std::string(curl_easy_strerror(res)));

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
        return body;
    }

    LookupResult interpret_response(long http_code, const std::string_view& body)
    {
        if (http_code != 200)
            return { LookupStatus::NotAvailable, std::string{not_available} };

        try
        {
            return { LookupStatus::Found, summarize(body) };
        }
        catch (BinLookupError& e)
        {
            spdlog::warn("Unusable BIN lookup response: {}", e.what());
            return { LookupStatus::Error, std::string{error_fetching} };
        }
    }

    LookupResult HttpBinLookup::fetch(const std::string_view& number)
    {
        auto bin = std::string{number.substr(0, 6)};
        auto url = p_base_url + bin;

        long http_code = 0;
        std::string body;
        try
        {
            body = get(url, http_code);
        }
        catch (BinLookupError& e)
        {
            spdlog::warn("BIN lookup for {} failed: {}", bin, e.what());
            return { LookupStatus::Error, std::string{error_fetching} };
        }

        if (http_code != 200)
            spdlog::info("BIN lookup for {} returned HTTP {}", bin, http_code);
        return interpret_response(http_code, body);
    }
}
