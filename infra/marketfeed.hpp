#pragma once
#include "../utils/logger.hpp"
#include "book.hpp"
#include <charconv>
#include <chrono>
#include <cstring>
#include <optional>
#include <rapidjson/document.h>
#include <string>
#include <vector>

// Turns market channel payloads (book snapshots and price_change deltas)
// into per-token books and a top-of-book for both tokens. Not thread-safe;
// owned by the market data thread.
class MarketFeedParser {
public:
    explicit MarketFeedParser(MarketInfo market)
        : m_market(std::move(market))
        , m_yesBook(m_market.yes_asset_id)
        , m_noBook(m_market.no_asset_id) {}

    void reset(MarketInfo market) {
        m_market = std::move(market);
        m_yesBook = Book(m_market.yes_asset_id);
        m_noBook = Book(m_market.no_asset_id);
        m_top = BookTop{};
        m_ready = false;
    }

    // Returns one event per token whose best price moved.
    std::vector<PriceChangedEvent> parse(const std::string& payload, std::chrono::system_clock::time_point now) {
        std::vector<PriceChangedEvent> events;
        if(payload.empty() || payload == "PONG" || payload == "pong") {
            return events;
        }

        rapidjson::Document document;
        document.Parse(payload.c_str());
        if(document.HasParseError()) {
            LoggerSingleton::get().infra().warning("market feed parse error offset=", document.GetErrorOffset());
            return events;
        }

        const BookTop before = m_top;
        if(document.IsArray()) {
            for(const auto& message : document.GetArray()) {
                apply_message(message);
            }
        } else if(document.IsObject()) {
            apply_message(document);
        }

        refresh_top(now);
        emit_if_moved(before, TokenSide::UP, now, events);
        emit_if_moved(before, TokenSide::DOWN, now, events);
        return events;
    }

    [[nodiscard]] const BookTop& top() const { return m_top; }

    // True once both tokens have a two-sided quote.
    [[nodiscard]] bool is_ready() const { return m_ready; }

    [[nodiscard]] const MarketInfo& market() const { return m_market; }

    [[nodiscard]] std::string subscribe_message() const {
        return R"({"assets_ids":[")" + m_market.yes_asset_id + R"(",")" + m_market.no_asset_id +
               R"("],"type":"market"})";
    }

private:
    static double parse_decimal(const rapidjson::Value& value) {
        if(value.IsNumber()) {
            return value.GetDouble();
        }
        if(!value.IsString()) {
            return 0.0;
        }
        const char* str = value.GetString();
        double result = 0.0;
        auto [ptr, ec] = std::from_chars(str, str + std::strlen(str), result);
        if(ec != std::errc()) {
            return 0.0;
        }
        return result;
    }

    static const char* string_member(const rapidjson::Value& object, const char* name) {
        auto it = object.FindMember(name);
        if(it == object.MemberEnd() || !it->value.IsString()) {
            return nullptr;
        }
        return it->value.GetString();
    }

    Book* book_for(const char* assetId) {
        if(assetId == nullptr) {
            return nullptr;
        }
        if(m_market.yes_asset_id == assetId) {
            return &m_yesBook;
        }
        if(m_market.no_asset_id == assetId) {
            return &m_noBook;
        }
        return nullptr;
    }

    void apply_message(const rapidjson::Value& message) {
        if(!message.IsObject()) {
            return;
        }
        const char* eventType = string_member(message, "event_type");
        if(eventType == nullptr) {
            return;
        }
        if(std::strcmp(eventType, "book") == 0) {
            apply_book(message);
        } else if(std::strcmp(eventType, "price_change") == 0) {
            apply_price_change(message);
        } else {
            LOG_INFRA_DEBUG("market feed ignored event_type=", eventType);
        }
    }

    void apply_book(const rapidjson::Value& message) {
        Book* book = book_for(string_member(message, "asset_id"));
        if(book == nullptr) {
            return;
        }
        book->reset();
        apply_levels(*book, message, "bids", true);
        apply_levels(*book, message, "asks", false);
        LOG_INFRA_DEBUG("market feed snapshot asset=", book->getAssetId(), " bids=", book->bidSide.size, " asks=", book->askSide.size);
    }

    static void apply_levels(Book& book, const rapidjson::Value& message, const char* side, bool bid) {
        auto it = message.FindMember(side);
        if(it == message.MemberEnd() || !it->value.IsArray()) {
            return;
        }
        for(const auto& level : it->value.GetArray()) {
            if(!level.IsObject() || !level.HasMember("price") || !level.HasMember("size")) {
                continue;
            }
            book.applyLevel(bid, parse_decimal(level["price"]), parse_decimal(level["size"]));
        }
    }

    void apply_price_change(const rapidjson::Value& message) {
        auto it = message.FindMember("price_changes");
        if(it == message.MemberEnd() || !it->value.IsArray()) {
            return;
        }
        for(const auto& change : it->value.GetArray()) {
            if(!change.IsObject()) {
                continue;
            }
            Book* book = book_for(string_member(change, "asset_id"));
            if(book == nullptr) {
                continue;
            }
            const char* side = string_member(change, "side");
            if(side != nullptr && change.HasMember("price") && change.HasMember("size")) {
                book->applyLevel(std::strcmp(side, "BUY") == 0, parse_decimal(change["price"]), parse_decimal(change["size"]));
            }
            if(change.HasMember("best_bid")) {
                book->setBestBid(parse_decimal(change["best_bid"]));
            }
            if(change.HasMember("best_ask")) {
                book->setBestAsk(parse_decimal(change["best_ask"]));
            }
        }
    }

    void refresh_top(std::chrono::system_clock::time_point now) {
        BookTop top;
        top.yes_bid = decimal_to_pips(m_yesBook.getBestBid());
        top.yes_ask = decimal_to_pips(m_yesBook.getBestAsk());
        top.no_bid = decimal_to_pips(m_noBook.getBestBid());
        top.no_ask = decimal_to_pips(m_noBook.getBestAsk());
        top.updated_at = now;
        m_top = top;
        m_ready = top.yes_bid > 0 && top.yes_ask > 0 && top.no_bid > 0 && top.no_ask > 0;
    }

    void emit_if_moved(const BookTop& before,
                       TokenSide token,
                       std::chrono::system_clock::time_point now,
                       std::vector<PriceChangedEvent>& events) const {
        const int64_t ask = m_top.ask_for(token);
        const int64_t bid = m_top.bid_for(token);
        if(ask == before.ask_for(token) && bid == before.bid_for(token)) {
            return;
        }
        PriceChangedEvent event;
        event.market = m_market.slug;
        event.token = token;
        event.new_price_pips = ask > 0 ? ask : bid;
        event.at = now;
        events.push_back(event);
    }

    MarketInfo m_market;
    Book m_yesBook;
    Book m_noBook;
    BookTop m_top;
    bool m_ready = false;
};
