#include "../../include/market/yahoo_chart_feed.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace intraday::market {

using json = nlohmann::json;

YahooChartFeed::YahooChartFeed(long timeout_ms, std::string base_url)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms), curl_(nullptr) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    curl_ = curl_easy_init();
    if (!curl_) {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL");
    }
}

YahooChartFeed::~YahooChartFeed() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

std::vector<PriceBar> YahooChartFeed::fetch(const std::string& symbol, BarInterval interval) {
    return parse_chart_json(http_get(chart_url(symbol, interval)));
}

std::string YahooChartFeed::chart_url(const std::string& symbol, BarInterval interval) const {
    // Index symbols such as ^NSEI need escaping
    std::string escaped = symbol;
    if (char* out = curl_easy_escape(curl_, symbol.c_str(), static_cast<int>(symbol.size()))) {
        escaped = out;
        curl_free(out);
    }

    return base_url_ + "/v8/finance/chart/" + escaped + "?interval=" + interval_to_string(interval) +
           "&range=1d&includePrePost=false";
}

size_t YahooChartFeed::write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

std::string YahooChartFeed::http_get(const std::string& url) {
    std::string response;

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    // Yahoo rejects requests without a browser-like agent
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "Mozilla/5.0 (X11; Linux x86_64)");

    // SSL options
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode res = curl_easy_perform(curl_);

    if (res != CURLE_OK) {
        throw FetchError(std::string("CURL error: ") + curl_easy_strerror(res));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 200) {
        throw FetchError("HTTP error " + std::to_string(http_code) + ": " + response.substr(0, 200));
    }

    return response;
}

namespace {

Price price_at(const json& column, size_t i) {
    if (i >= column.size() || column[i].is_null()) {
        return 0;
    }
    return to_price(column[i].get<double>());
}

} // namespace

std::vector<PriceBar> YahooChartFeed::parse_chart_json(const std::string& body) {
    std::vector<PriceBar> bars;

    try {
        json data = json::parse(body);
        const json& chart = data.at("chart");

        if (chart.contains("error") && !chart["error"].is_null()) {
            const json& err = chart["error"];
            std::string description = err.value("description", std::string("unknown error"));
            throw FetchError("Provider error: " + description);
        }

        const json& results = chart.at("result");
        if (!results.is_array() || results.empty()) {
            throw FetchError("Provider returned no chart result");
        }

        const json& result = results[0];
        // No trades yet in the session: valid, just empty
        if (!result.contains("timestamp")) {
            return bars;
        }

        const json& timestamps = result.at("timestamp");
        const json& quote = result.at("indicators").at("quote").at(0);
        const json& open = quote.at("open");
        const json& high = quote.at("high");
        const json& low = quote.at("low");
        const json& close = quote.at("close");
        const json& volume = quote.contains("volume") ? quote["volume"] : json::array();

        bars.reserve(timestamps.size());
        for (size_t i = 0; i < timestamps.size(); ++i) {
            if (i >= close.size() || close[i].is_null()) {
                continue;
            }

            PriceBar b;
            b.open_time = timestamps[i].get<Timestamp>() * MS_PER_SECOND;
            b.close = to_price(close[i].get<double>());
            b.open = price_at(open, i);
            b.high = price_at(high, i);
            b.low = price_at(low, i);
            if (b.open == 0) b.open = b.close;
            if (b.high == 0) b.high = std::max(b.open, b.close);
            if (b.low == 0) b.low = std::min(b.open, b.close);
            b.volume = (i < volume.size() && !volume[i].is_null()) ? volume[i].get<double>() : 0;
            bars.push_back(b);
        }
    } catch (const json::exception& e) {
        throw FetchError(std::string("Malformed chart payload: ") + e.what());
    }

    std::stable_sort(bars.begin(), bars.end(),
                     [](const PriceBar& a, const PriceBar& b) { return a.open_time < b.open_time; });
    return bars;
}

} // namespace intraday::market
