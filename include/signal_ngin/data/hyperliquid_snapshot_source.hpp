// include/signal_ngin/data/hyperliquid_snapshot_source.hpp
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include "signal_ngin/core/clock.hpp"
#include "signal_ngin/core/config_base.hpp"
#include "signal_ngin/data/market_snapshot_source.hpp"

namespace signal_ngin {

/**
 * @brief Connection and aggregation settings for the Hyperliquid info API
 */
struct HyperliquidConfig : public ConfigBase {
    std::string coin{"HYPE"};
    std::string api_url{"https://api.hyperliquid.xyz/info"};
    int request_timeout_ms{2000};
    int max_staleness_ms{5000};   // Books older than this are treated as unavailable
    int book_levels{5};           // Levels summed into bid_depth / ask_depth
    int trade_window_ms{30000};   // Trade flow aggregation window
    bool verify_tls{true};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["coin"] = coin;
        j["api_url"] = api_url;
        j["request_timeout_ms"] = request_timeout_ms;
        j["max_staleness_ms"] = max_staleness_ms;
        j["book_levels"] = book_levels;
        j["trade_window_ms"] = trade_window_ms;
        j["verify_tls"] = verify_tls;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("coin"))
            coin = j.at("coin").get<std::string>();
        if (j.contains("api_url"))
            api_url = j.at("api_url").get<std::string>();
        if (j.contains("request_timeout_ms"))
            request_timeout_ms = j.at("request_timeout_ms").get<int>();
        if (j.contains("max_staleness_ms"))
            max_staleness_ms = j.at("max_staleness_ms").get<int>();
        if (j.contains("book_levels"))
            book_levels = j.at("book_levels").get<int>();
        if (j.contains("trade_window_ms"))
            trade_window_ms = j.at("trade_window_ms").get<int>();
        if (j.contains("verify_tls"))
            verify_tls = j.at("verify_tls").get<bool>();
    }
};

/**
 * @brief Aggregated trade flow over a window
 */
struct TradeFlow {
    double buy_volume{0.0};
    double sell_volume{0.0};
    int trade_count{0};
};

/**
 * @brief Pull-style snapshot source backed by the Hyperliquid REST info endpoint
 *
 * Each fetch issues an l2Book request and a recentTrades request for the configured coin.
 * Both requests share the caller's timeout.
 */
class HyperliquidSnapshotSource : public MarketSnapshotSource {
public:
    HyperliquidSnapshotSource(HyperliquidConfig config, std::shared_ptr<Clock> clock);
    ~HyperliquidSnapshotSource() override;

    HyperliquidSnapshotSource(const HyperliquidSnapshotSource&) = delete;
    HyperliquidSnapshotSource& operator=(const HyperliquidSnapshotSource&) = delete;

    Result<SnapshotPtr> fetch(std::chrono::milliseconds timeout) override;

    std::string name() const override {
        return "hyperliquid:" + config_.coin;
    }

    /**
     * @brief Parse an l2Book response into the book fields of a snapshot
     * @param response {"coin":..,"time":ms,"levels":[[bids..],[asks..]]}
     * @param levels Number of levels summed into the depth fields
     */
    static Result<MarketSnapshot> parse_l2_book(const nlohmann::json& response, int levels);

    /**
     * @brief Aggregate recentTrades entries whose time lies in (window_end - window, window_end]
     *
     * Side "B" is buyer-initiated, side "A" seller-initiated.
     */
    static Result<TradeFlow> summarize_trades(const nlohmann::json& response, Timestamp window_end,
                                              std::chrono::milliseconds window);

private:
    Result<nlohmann::json> post_info(const nlohmann::json& request,
                                     std::chrono::milliseconds timeout);

    HyperliquidConfig config_;
    std::shared_ptr<Clock> clock_;
    void* curl_{nullptr};  // CURL easy handle, reused across requests
    std::mutex mutex_;
    Timestamp last_book_time_{};
};

}  // namespace signal_ngin
