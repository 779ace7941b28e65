#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/reversal_confirmer.hpp"
#include "../src/range_tracker.hpp"
#include "test_bars.hpp"

using namespace testbars;

namespace {

AsianRange make_range(const StrategyConfig& config) {
    auto window = SessionWindow::for_day("XAUUSD", DAY_MS, config.session_start_minute,
                                         config.session_end_minute);
    return *RangeTracker::compute_range(asian_window(), window, config).range;
}

SweepEvent make_sweep(const AsianRange& range, SweepDirection direction, double breach) {
    SweepEvent sweep;
    sweep.direction = direction;
    sweep.breach_price = breach;
    sweep.breach_time_ms = at(6, 5);
    sweep.threshold_used = 0.5;
    sweep.range_reference = range;
    return sweep;
}

} // namespace

TEST_CASE("Upside sweep confirms in order", "[reversal]") {
    StrategyConfig config;
    ReversalConfirmer confirmer(config);
    AsianRange range = make_range(config);
    SweepEvent sweep = make_sweep(range, SweepDirection::Upside, 2000.6);

    auto record = confirmer.begin(sweep, micro_before_upside_break());
    REQUIRE(record.swing_level.has_value());
    REQUIRE(*record.swing_level == 1999.2);
    REQUIRE_FALSE(record.break_time_ms.has_value());

    // Sweep bar closes outside the range
    auto status = confirmer.evaluate(record, {bar(at(6, 5), 1999.9, 2000.6, 1999.2, 2000.4)}, {});
    REQUIRE(status == ReversalStatus::Pending);
    REQUIRE_FALSE(record.close_back_inside);
    REQUIRE(record.consecutive_closes_outside == 1);

    // Micro close through the swing low
    status = confirmer.evaluate(record, {}, {bar(at(6, 10), 2000.4, 2000.0, 1994.8, 1995.0)});
    REQUIRE(status == ReversalStatus::Pending);
    REQUIRE(record.break_time_ms.has_value());
    REQUIRE_FALSE(record.structural_break);

    // Primary close back inside with a strong displacement
    status = confirmer.evaluate(record, {bar(at(6, 10), 2000.4, 2000.4, 1994.8, 1995.0)}, {});
    REQUIRE(status == ReversalStatus::Confirmed);
    REQUIRE(record.close_back_inside);
    REQUIRE(record.displacement_ok);
    REQUIRE(record.structural_break);
    REQUIRE(record.reentry_close == 1995.0);
    REQUIRE(record.displacement_ratio == Catch::Approx(5.6 / 0.6));
    REQUIRE(*record.confirmed_at_ms == at(6, 10));

    auto j = record.to_json();
    REQUIRE(j["status"] == "confirmed");
    REQUIRE(j["direction"] == "upside");
}

TEST_CASE("Sub-checks pass once and stay passed", "[reversal]") {
    StrategyConfig config;
    ReversalConfirmer confirmer(config);
    AsianRange range = make_range(config);
    SweepEvent sweep = make_sweep(range, SweepDirection::Upside, 2000.6);

    auto record = confirmer.begin(sweep, {});
    confirmer.evaluate(record, {
        bar(at(6, 5), 1999.9, 2000.6, 1999.5, 2000.4),
        bar(at(6, 10), 2000.4, 2000.4, 1994.8, 1995.0),
    }, {});

    REQUIRE(record.close_back_inside);
    REQUIRE(record.displacement_ok);
    REQUIRE_FALSE(record.structural_break);
    REQUIRE(record.status == ReversalStatus::Pending);

    // Price pokes back outside; earlier steps are kept
    auto status = confirmer.evaluate(record, {bar(at(6, 15), 1995.0, 2000.4, 1995.0, 2000.3)}, {});
    REQUIRE(status == ReversalStatus::Pending);
    REQUIRE(record.close_back_inside);
    REQUIRE(record.displacement_ok);

    // Micro swing low at 06:13, broken at 06:16
    status = confirmer.evaluate(record, {}, {
        bar(at(6, 11), 1996.8, 1997.0, 1996.0, 1996.5),
        bar(at(6, 12), 1996.5, 1996.6, 1995.5, 1995.8),
        bar(at(6, 13), 1995.8, 1996.0, 1994.0, 1994.6),
        bar(at(6, 14), 1994.6, 1995.4, 1994.5, 1995.2),
        bar(at(6, 15), 1995.2, 1995.8, 1995.0, 1995.5),
        bar(at(6, 16), 1995.5, 1995.6, 1993.2, 1993.5),
    });

    REQUIRE(status == ReversalStatus::Confirmed);
    REQUIRE(*record.swing_level == 1994.0);
    REQUIRE(*record.confirmed_at_ms == at(6, 16));
}

TEST_CASE("Downside sweep mirrors the upside", "[reversal]") {
    StrategyConfig config;
    ReversalConfirmer confirmer(config);
    AsianRange range = make_range(config);
    SweepEvent sweep = make_sweep(range, SweepDirection::Downside, 1989.4);

    // 06:07 is a swing high at 1990.8
    auto record = confirmer.begin(sweep, {
        bar(at(6, 5), 1990.0, 1990.0, 1989.5, 1989.8),
        bar(at(6, 6), 1989.8, 1990.3, 1989.4, 1989.6),
        bar(at(6, 7), 1989.6, 1990.8, 1989.6, 1990.5),
        bar(at(6, 8), 1990.5, 1990.5, 1989.6, 1989.7),
        bar(at(6, 9), 1989.7, 1990.2, 1989.6, 1989.6),
    });
    REQUIRE(*record.swing_level == 1990.8);

    confirmer.evaluate(record, {bar(at(6, 5), 1990.0, 1990.8, 1989.4, 1989.6)}, {});
    confirmer.evaluate(record, {}, {bar(at(6, 10), 1989.6, 1995.2, 1989.6, 1995.0)});
    auto status = confirmer.evaluate(record, {bar(at(6, 10), 1989.6, 1995.2, 1989.6, 1995.0)}, {});

    REQUIRE(status == ReversalStatus::Confirmed);
    REQUIRE(record.displacement_ratio == Catch::Approx(5.6 / 0.6));
}

TEST_CASE("Confirmation expiry", "[reversal]") {
    StrategyConfig config;
    AsianRange range = make_range(config);
    SweepEvent sweep = make_sweep(range, SweepDirection::Upside, 2000.6);

    SECTION("Minute budget elapses with price outside") {
        config.acceptance_outside_closes = 0;
        ReversalConfirmer confirmer(config);
        auto record = confirmer.begin(sweep, {});

        for (int minute = 5; minute <= 35; minute += 5) {
            auto status = confirmer.evaluate(record, {bar(at(6, minute), 2000.3, 2000.5, 2000.1, 2000.3)}, {});
            REQUIRE(status == ReversalStatus::Pending);
        }

        auto status = confirmer.evaluate(record, {bar(at(6, 40), 2000.3, 2000.5, 2000.1, 2000.3)}, {});
        REQUIRE(status == ReversalStatus::Expired);
        REQUIRE(record.expiry_reason == "lookahead_elapsed");
        REQUIRE_FALSE(record.close_back_inside);
    }

    SECTION("Bar budget counts bars after the sweep bar") {
        config.acceptance_outside_closes = 0;
        config.reversal_lookahead_bars = 3;
        config.reversal_lookahead_minutes = 0;
        ReversalConfirmer confirmer(config);
        auto record = confirmer.begin(sweep, {});

        for (int i = 0; i <= 3; ++i) {
            auto status = confirmer.evaluate(record, {bar(at(6, 5 + 5 * i), 2000.3, 2000.5, 2000.1, 2000.3)}, {});
            REQUIRE(status == ReversalStatus::Pending);
        }

        auto status = confirmer.evaluate(record, {bar(at(6, 25), 2000.3, 2000.5, 2000.1, 2000.3)}, {});
        REQUIRE(status == ReversalStatus::Expired);
    }

    SECTION("Consecutive closes beyond the range are accepted breakout") {
        ReversalConfirmer confirmer(config);
        auto record = confirmer.begin(sweep, {});

        auto status = confirmer.evaluate(record, {
            bar(at(6, 5), 1999.9, 2000.6, 1999.5, 2000.4),
            bar(at(6, 10), 2000.4, 2000.5, 2000.1, 2000.2),
        }, {});

        REQUIRE(status == ReversalStatus::Expired);
        REQUIRE(record.expiry_reason == "acceptance_outside");
    }

    SECTION("Expired stays expired") {
        ReversalConfirmer confirmer(config);
        auto record = confirmer.begin(sweep, {});
        confirmer.evaluate(record, {
            bar(at(6, 5), 1999.9, 2000.6, 1999.5, 2000.4),
            bar(at(6, 10), 2000.4, 2000.5, 2000.1, 2000.2),
        }, {});

        auto status = confirmer.evaluate(record, {bar(at(6, 15), 2000.2, 2000.2, 1994.0, 1995.0)}, {});
        REQUIRE(status == ReversalStatus::Expired);
        REQUIRE_FALSE(record.close_back_inside);
    }
}

TEST_CASE("Displacement", "[reversal]") {
    StrategyConfig config;
    ReversalConfirmer confirmer(config);
    AsianRange range = make_range(config);
    SweepEvent sweep = make_sweep(range, SweepDirection::Upside, 2000.6);

    SECTION("Slow grind back inside is not displacement") {
        auto record = confirmer.begin(sweep, {});
        confirmer.evaluate(record, {
            bar(at(6, 5), 2000.0, 2000.6, 1999.8, 1999.9),
            bar(at(6, 10), 1999.9, 2000.0, 1999.7, 1999.8),
            bar(at(6, 15), 1999.8, 1999.9, 1999.7, 1999.8),
            bar(at(6, 20), 1999.8, 1999.9, 1999.7, 1999.8),
            bar(at(6, 25), 1999.8, 1999.8, 1994.5, 1995.0),
        }, {});

        REQUIRE(record.close_back_inside);
        REQUIRE_FALSE(record.displacement_ok);
        REQUIRE(record.status == ReversalStatus::Pending);
    }

    SECTION("Extension beyond the breach moves the extreme") {
        auto record = confirmer.begin(sweep, {});
        confirmer.evaluate(record, {
            bar(at(6, 5), 2000.0, 2000.6, 1999.8, 1999.9),
            bar(at(6, 10), 1999.9, 2001.0, 1999.9, 2000.3),
            bar(at(6, 15), 2000.3, 2000.4, 1998.8, 1999.0),
        }, {});

        REQUIRE(record.extreme_price == 2001.0);
        REQUIRE(record.extreme_bar_index == 1);
        REQUIRE(record.displacement_ok);
        REQUIRE(record.displacement_ratio == Catch::Approx(2.0));
    }
}

TEST_CASE("Micro break must follow the re-entry and the final extreme", "[reversal]") {
    StrategyConfig config;
    AsianRange range = make_range(config);
    SweepEvent sweep = make_sweep(range, SweepDirection::Upside, 2000.6);

    // Swing low at 2000.4 on 06:07, all above the range high
    std::vector<Bar> micro = {
        bar(at(6, 5), 2000.5, 2000.6, 2000.5, 2000.6),
        bar(at(6, 6), 2000.6, 2000.6, 2000.6, 2000.6),
        bar(at(6, 7), 2000.6, 2000.6, 2000.4, 2000.5),
        bar(at(6, 8), 2000.5, 2000.6, 2000.5, 2000.6),
        bar(at(6, 9), 2000.6, 2000.6, 2000.6, 2000.6),
    };
    Bar sweep_bar = bar(at(6, 5), 2000.1, 2000.6, 2000.0, 2000.6);
    Bar early_break = bar(at(6, 10), 2000.6, 2000.6, 2000.2, 2000.2);
    Bar late_break = bar(at(6, 16), 1996.5, 1996.8, 1995.9, 1996.0);

    SECTION("New extreme discards the earlier break") {
        ReversalConfirmer confirmer(config);
        auto record = confirmer.begin(sweep, micro);
        REQUIRE(*record.swing_level == 2000.4);

        confirmer.evaluate(record, {sweep_bar}, {early_break});
        REQUIRE(record.break_time_ms.has_value());

        auto status = confirmer.evaluate(record, {bar(at(6, 10), 2000.6, 2002.0, 1999.6, 1999.8)}, {});
        REQUIRE(status == ReversalStatus::Pending);
        REQUIRE(record.extreme_price == 2002.0);
        REQUIRE(record.close_back_inside);
        REQUIRE_FALSE(record.break_time_ms.has_value());

        status = confirmer.evaluate(record, {bar(at(6, 15), 1999.8, 1999.9, 1995.8, 1996.0)}, {});
        REQUIRE(status == ReversalStatus::Pending);
        REQUIRE(record.displacement_ok);
        REQUIRE_FALSE(record.structural_break);

        status = confirmer.evaluate(record, {}, {late_break});
        REQUIRE(status == ReversalStatus::Confirmed);
        REQUIRE(*record.confirmed_at_ms == at(6, 16));
    }

    SECTION("Break before the close back inside is not enough") {
        config.acceptance_outside_closes = 3;
        ReversalConfirmer confirmer(config);
        auto record = confirmer.begin(sweep, micro);

        confirmer.evaluate(record, {sweep_bar}, {early_break});
        confirmer.evaluate(record, {bar(at(6, 10), 2000.6, 2000.6, 2000.1, 2000.3)}, {});
        REQUIRE_FALSE(record.close_back_inside);

        auto status = confirmer.evaluate(record, {bar(at(6, 15), 2000.3, 2000.4, 1995.8, 1996.0)}, {});
        REQUIRE(status == ReversalStatus::Pending);
        REQUIRE(record.close_back_inside);
        REQUIRE(record.displacement_ok);
        REQUIRE(record.reentry_time_ms == at(6, 15));
        REQUIRE_FALSE(record.structural_break);

        status = confirmer.evaluate(record, {}, {late_break});
        REQUIRE(status == ReversalStatus::Confirmed);
        REQUIRE(*record.confirmed_at_ms == at(6, 16));
    }
}

TEST_CASE("Re-evaluating the same bars changes nothing", "[reversal]") {
    StrategyConfig config;
    ReversalConfirmer confirmer(config);
    AsianRange range = make_range(config);
    SweepEvent sweep = make_sweep(range, SweepDirection::Upside, 2000.6);

    auto record = confirmer.begin(sweep, micro_before_upside_break());
    std::vector<Bar> primary = {bar(at(6, 5), 1999.9, 2000.6, 1999.2, 2000.4)};

    confirmer.evaluate(record, primary, {});
    confirmer.evaluate(record, primary, micro_before_upside_break());
    confirmer.evaluate(record, primary, {});

    REQUIRE(record.primary_bars_seen == 1);
    REQUIRE(record.consecutive_closes_outside == 1);
    REQUIRE(record.status == ReversalStatus::Pending);
}
