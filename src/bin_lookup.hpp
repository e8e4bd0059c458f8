#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace bin_lookup
{
    class BinLookupError : public std::runtime_error
    {
    public:
        explicit BinLookupError(const std::string& msg) : std::runtime_error(msg) {}
    };

    enum class LookupStatus
    {
        Found,
        NotAvailable,
        Error
    };

    /**
     * `summary` is always ready to show: the formatted metadata line when the
     * lookup succeeded, otherwise the matching "not available" or "error"
     * sentinel line.
     */
    struct LookupResult
    {
        LookupStatus status;
        std::string summary;
    };

    constexpr std::string_view not_available = "BIN Info: Not available";
    constexpr std::string_view error_fetching = "BIN Info: Error fetching data";

    /**
     * Turns a lookup service JSON body into
     * "BIN Info: <bank> (<country>) - <type> <scheme>". Missing fields are
     * filled with "Unknown Bank", "Unknown Country" and so on.
     *
     * @throws BinLookupError when the body is not a JSON object
     */
    std::string summarize(const std::string_view& body);

    /**
     * Maps a finished lookup reply to its result: anything but HTTP 200 is
     * "not available", a 200 whose body cannot be summarized is an error.
     */
    LookupResult interpret_response(long http_code, const std::string_view& body);

    /**
     * Source of issuer metadata for the leading digits of a card number.
     * Implementations may block, so callers keep them off any thread that
     * must stay responsive.
     */
    class BinLookup
    {
    public:
        virtual ~BinLookup() = default;

        /**
         * Looks up the first six digits of `number`. Never throws for
         * transport or service failures; those come back as a LookupResult
         * with an error status.
         */
        virtual LookupResult fetch(const std::string_view& number) = 0;
    };

    class HttpBinLookup : public BinLookup
    {
        std::string p_base_url;
        long p_timeout;
    public:
        HttpBinLookup(std::string base_url, long timeout_seconds) : p_base_url(std::move(base_url)), p_timeout(timeout_seconds) {}

        LookupResult fetch(const std::string_view& number) override;

    private:
        std::string get(const std::string& url, long& http_code) const;
    };
}
