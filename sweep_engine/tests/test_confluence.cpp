#include <catch2/catch_test_macros.hpp>
#include "../src/confluence.hpp"
#include "test_bars.hpp"

using namespace testbars;

namespace {

ReversalConfirmation confirmed(SweepDirection direction, RangeGrade grade = RangeGrade::Normal) {
    ReversalConfirmation record;
    record.sweep.direction = direction;
    record.sweep.breach_price = direction == SweepDirection::Upside ? 2000.6 : 1989.4;
    record.sweep.breach_time_ms = at(6, 5);
    record.sweep.threshold_used = 0.5;
    record.sweep.range_reference.high = 2000.0;
    record.sweep.range_reference.low = 1990.0;
    record.sweep.range_reference.midpoint = 1995.0;
    record.sweep.range_reference.range_pips = 100.0;
    record.sweep.range_reference.grade = grade;
    record.sweep.range_reference.is_valid = true;
    record.status = ReversalStatus::Confirmed;
    record.confirmed_at_ms = at(6, 10);
    return record;
}

MarketContext context_at(int64_t ts) {
    MarketContext context;
    context.timestamp_ms = ts;
    return context;
}

} // namespace

TEST_CASE("Spread gate", "[confluence]") {
    SpreadGate gate(2.0);
    auto record = confirmed(SweepDirection::Upside);
    auto context = context_at(at(6, 10));

    REQUIRE(gate.evaluate(record, context).passed);

    context.spread_pips = 1.5;
    REQUIRE(gate.evaluate(record, context).passed);

    context.spread_pips = 2.5;
    auto outcome = gate.evaluate(record, context);
    REQUIRE_FALSE(outcome.passed);
    REQUIRE(outcome.reason.find("spread 2.5") != std::string::npos);
}

TEST_CASE("News blackout gate", "[confluence]") {
    NewsBlackoutGate gate(60, 30);
    auto record = confirmed(SweepDirection::Upside);
    auto context = context_at(at(8, 0));

    SECTION("Tier-1 release uses the wider buffer") {
        context.news.push_back({at(8, 45), "Non-Farm Payrolls", true});
        auto outcome = gate.evaluate(record, context);
        REQUIRE_FALSE(outcome.passed);
        REQUIRE(outcome.reason.find("Non-Farm Payrolls") != std::string::npos);
    }

    SECTION("Other releases use the narrower buffer") {
        context.news.push_back({at(8, 45), "Jobless Claims", false});
        REQUIRE(gate.evaluate(record, context).passed);
    }

    SECTION("Recent past releases also block") {
        context.news.push_back({at(7, 40), "Jobless Claims", false});
        REQUIRE_FALSE(gate.evaluate(record, context).passed);
    }
}

TEST_CASE("Auction blackout gate", "[confluence]") {
    AuctionBlackoutGate gate({10 * 60 + 30, 15 * 60}, 15);
    auto record = confirmed(SweepDirection::Upside);

    REQUIRE_FALSE(gate.evaluate(record, context_at(at(10, 20))).passed);
    REQUIRE(gate.evaluate(record, context_at(at(10, 50))).passed);
    REQUIRE_FALSE(gate.evaluate(record, context_at(at(15, 15))).passed);
    REQUIRE(gate.evaluate(record, context_at(at(6, 10))).passed);
}

TEST_CASE("Higher timeframe bias gate", "[confluence]") {
    BiasGate gate;
    auto context = context_at(at(6, 10));

    SECTION("Fading an aligned bull trend is blocked") {
        context.bias_d1 = TrendBias::Bull;
        context.bias_h4 = TrendBias::Bull;
        REQUIRE_FALSE(gate.evaluate(confirmed(SweepDirection::Upside), context).passed);
        REQUIRE(gate.evaluate(confirmed(SweepDirection::Downside), context).passed);
    }

    SECTION("Mixed bias passes") {
        context.bias_d1 = TrendBias::Bull;
        context.bias_h4 = TrendBias::Range;
        REQUIRE(gate.evaluate(confirmed(SweepDirection::Upside), context).passed);
    }

    SECTION("Fading an aligned bear trend is blocked") {
        context.bias_d1 = TrendBias::Bear;
        context.bias_h4 = TrendBias::Bear;
        REQUIRE_FALSE(gate.evaluate(confirmed(SweepDirection::Downside), context).passed);
    }
}

TEST_CASE("Range grade gate", "[confluence]") {
    RangeGradeGate gate;
    auto context = context_at(at(6, 10));

    REQUIRE(gate.evaluate(confirmed(SweepDirection::Upside, RangeGrade::Normal), context).passed);
    REQUIRE_FALSE(gate.evaluate(confirmed(SweepDirection::Upside, RangeGrade::NoTrade), context).passed);
}

TEST_CASE("Velocity spike gate", "[confluence]") {
    VelocitySpikeGate gate(2.0, 12);
    auto record = confirmed(SweepDirection::Upside);
    auto context = context_at(at(7, 0));

    for (int i = 0; i < 12; ++i) {
        context.recent_bars.push_back(bar(at(6, i * 5), 1995.0, 1995.5, 1994.5, 1995.0));
    }

    SECTION("Too little history passes") {
        context.recent_bars.push_back(bar(at(7, 0), 1995.0, 1998.0, 1995.0, 1997.0));
        context.recent_bars.erase(context.recent_bars.begin());
        REQUIRE(gate.evaluate(record, context).passed);
    }

    SECTION("Bar range above the multiple blocks") {
        context.recent_bars.push_back(bar(at(7, 0), 1995.0, 1998.0, 1995.0, 1997.0));
        REQUIRE_FALSE(gate.evaluate(record, context).passed);
    }

    SECTION("Normal bar passes") {
        context.recent_bars.push_back(bar(at(7, 0), 1995.0, 1996.0, 1994.5, 1995.5));
        REQUIRE(gate.evaluate(record, context).passed);
    }
}

TEST_CASE("Trend day gate", "[confluence]") {
    TrendDayGate gate(25.0);
    auto up = confirmed(SweepDirection::Upside);
    auto down = confirmed(SweepDirection::Downside);
    auto context = context_at(at(9, 0));
    context.adx_m15 = 32.0;
    context.h1_band_walk = true;
    context.bias_h4 = TrendBias::Bull;

    SECTION("Fading a strong H4 trend is blocked") {
        auto outcome = gate.evaluate(up, context);
        REQUIRE_FALSE(outcome.passed);
        REQUIRE(outcome.reason.find("ADX(M15) 32.0") != std::string::npos);
    }

    SECTION("A fade with the H4 trend passes") {
        REQUIRE(gate.evaluate(down, context).passed);
    }

    SECTION("Needs both ADX and a band walk") {
        context.h1_band_walk = false;
        REQUIRE(gate.evaluate(up, context).passed);

        context.h1_band_walk = true;
        context.adx_m15 = 25.0;
        REQUIRE(gate.evaluate(up, context).passed);

        context.adx_m15.reset();
        REQUIRE(gate.evaluate(up, context).passed);
    }

    SECTION("Bearish mirror") {
        context.bias_h4 = TrendBias::Bear;
        REQUIRE_FALSE(gate.evaluate(down, context).passed);
        REQUIRE(gate.evaluate(up, context).passed);
    }
}

TEST_CASE("NY participation gate", "[confluence]") {
    NyParticipationGate gate;
    auto record = confirmed(SweepDirection::Upside);
    auto context = context_at(at(14, 0));

    REQUIRE(gate.evaluate(record, context).passed);

    context.london_traversed_asia = true;
    auto outcome = gate.evaluate(record, context);
    REQUIRE_FALSE(outcome.passed);
    REQUIRE(outcome.reason.find("fresh NY sweep") != std::string::npos);

    context.ny_fresh_sweep = true;
    REQUIRE(gate.evaluate(record, context).passed);
}

TEST_CASE("Participation gate", "[confluence]") {
    ParticipationGate gate({{7, 4}, {12, 25}});
    auto record = confirmed(SweepDirection::Upside);
    constexpr int64_t JUL_4_2024 = 1720051200000;
    constexpr int64_t DEC_20_2023 = 1703030400000;
    constexpr int64_t JAN_5_2024 = 1704412800000;
    constexpr int64_t JAN_8_2024 = 1704672000000;

    REQUIRE(gate.evaluate(record, context_at(at(6, 10))).passed);
    REQUIRE(gate.evaluate(record, context_at(at(6, 10, JAN_8_2024))).passed);

    auto outcome = gate.evaluate(record, context_at(at(6, 10, JUL_4_2024)));
    REQUIRE_FALSE(outcome.passed);
    REQUIRE(outcome.reason == "holiday 07-04");

    outcome = gate.evaluate(record, context_at(at(6, 10, DEC_20_2023)));
    REQUIRE_FALSE(outcome.passed);
    REQUIRE(outcome.reason.find("year-end") != std::string::npos);
    REQUIRE_FALSE(gate.evaluate(record, context_at(at(23, 0, JAN_5_2024))).passed);
}

TEST_CASE("Confluence checker", "[confluence]") {
    auto record = confirmed(SweepDirection::Upside);

    SECTION("No gates always passes") {
        ConfluenceChecker checker;
        auto result = checker.check(record, context_at(at(6, 10)));
        REQUIRE(result.passed);
        REQUIRE(result.failure_reasons.empty());
    }

    SECTION("Default gate set") {
        ConfluenceSettings settings;
        auto checker = ConfluenceChecker::with_default_gates(settings);
        REQUIRE(checker->gate_count() == 9);
        REQUIRE(checker->gate_names().front() == "spread");
        REQUIRE(checker->gate_names().back() == "participation");

        settings.bias_gate = false;
        settings.grade_gate = false;
        REQUIRE(ConfluenceChecker::with_default_gates(settings)->gate_count() == 7);

        settings.trend_day_gate = false;
        settings.ny_participation_gate = false;
        settings.participation_gate = false;
        REQUIRE(ConfluenceChecker::with_default_gates(settings)->gate_count() == 4);
    }

    SECTION("Every failing gate is reported") {
        auto checker = ConfluenceChecker::with_default_gates(ConfluenceSettings{});
        auto context = context_at(at(10, 30));
        context.spread_pips = 5.0;

        auto result = checker->check(record, context);

        REQUIRE_FALSE(result.passed);
        REQUIRE(result.failure_reasons.size() == 2);
        REQUIRE(result.failure_reasons[0].rfind("spread: ", 0) == 0);
        REQUIRE(result.failure_reasons[1].rfind("auction_blackout: ", 0) == 0);
        REQUIRE(result.to_json()["passed"] == false);
    }
}
