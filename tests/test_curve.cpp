// Copyright 2021-2024 Francesco Fusco <f.fusco@pm.me>
// SPDX-License-Identifier: GPL-3.0-or-later

#include <set>
#include <stdexcept>
#include <gtest/gtest.h>
#include <sunbrightd/curve.hpp>

using namespace sunbrightd;

namespace {

constexpr std::time_t h = 3600;
constexpr std::time_t m = 60;

class CurveTest : public ::testing::Test {
protected:
	const transition_window morning {6 * h, 7 * h};
	const transition_window evening {19 * h, 21 * h};
	const brightness_profile profile {100, 60};
};

}

TEST_F(CurveTest, NightBeforeDawn) {
	for (int steps = 1; steps <= 10; ++steps) {
		EXPECT_EQ(evaluate(0, morning, evening, profile, steps), 60);
		EXPECT_EQ(evaluate(6 * h - 1, morning, evening, profile, steps), 60);
	}
}

TEST_F(CurveTest, NightFromDusk) {
	EXPECT_EQ(evaluate(21 * h, morning, evening, profile, 5), 60);
	EXPECT_EQ(evaluate(23 * h, morning, evening, profile, 5), 60);
}

TEST_F(CurveTest, DayBetweenWindows) {
	for (std::time_t t = 7 * h; t < 19 * h; t += 17 * m) {
		EXPECT_EQ(evaluate(t, morning, evening, profile, 3), 100);
	}
	EXPECT_EQ(evaluate(19 * h - 1, morning, evening, profile, 3), 100);
}

TEST_F(CurveTest, TwoStepsMorning) {
	EXPECT_NEAR(evaluate(6 * h, morning, evening, profile, 2), 73.333, 0.001);
	EXPECT_NEAR(evaluate(6 * h + 29 * m, morning, evening, profile, 2), 73.333, 0.001);
	EXPECT_NEAR(evaluate(6 * h + 30 * m, morning, evening, profile, 2), 86.667, 0.001);
	EXPECT_NEAR(evaluate(7 * h - 1, morning, evening, profile, 2), 86.667, 0.001);
	EXPECT_EQ(evaluate(7 * h, morning, evening, profile, 2), 100);
}

TEST_F(CurveTest, TwoStepsEvening) {
	// 19:00 - 21:00, two one-hour plateaus going down
	EXPECT_NEAR(evaluate(19 * h, morning, evening, profile, 2), 86.667, 0.001);
	EXPECT_NEAR(evaluate(20 * h - 1, morning, evening, profile, 2), 86.667, 0.001);
	EXPECT_NEAR(evaluate(20 * h, morning, evening, profile, 2), 73.333, 0.001);
	EXPECT_NEAR(evaluate(21 * h - 1, morning, evening, profile, 2), 73.333, 0.001);
}

TEST_F(CurveTest, Monotonic) {
	for (int steps = 1; steps <= 10; ++steps) {
		double prev = evaluate(morning.start(), morning, evening, profile, steps);
		for (std::time_t t = morning.start(); t <= morning.end(); t += 30) {
			const double val = evaluate(t, morning, evening, profile, steps);
			EXPECT_GE(val, prev) << "steps: " << steps << ", t: " << t;
			prev = val;
		}

		prev = evaluate(evening.start(), morning, evening, profile, steps);
		for (std::time_t t = evening.start(); t <= evening.end(); t += 30) {
			const double val = evaluate(t, morning, evening, profile, steps);
			EXPECT_LE(val, prev) << "steps: " << steps << ", t: " << t;
			prev = val;
		}
	}
}

TEST_F(CurveTest, StaysBelowDayInsideWindows) {
	for (int steps = 1; steps <= 10; ++steps) {
		EXPECT_LT(evaluate(morning.end() - 1, morning, evening, profile, steps), 100);
		EXPECT_LT(evaluate(evening.start(), morning, evening, profile, steps), 100);
		EXPECT_GT(evaluate(morning.start(), morning, evening, profile, steps), 60);
		EXPECT_GT(evaluate(evening.end() - 1, morning, evening, profile, steps), 60);
	}
}

TEST_F(CurveTest, PlateauCount) {
	// one distinct value per plateau
	for (int steps = 1; steps <= 10; ++steps) {
		std::set<double> values;
		for (std::time_t t = morning.start(); t < morning.end(); ++t) {
			values.insert(evaluate(t, morning, evening, profile, steps));
		}
		EXPECT_EQ(values.size(), size_t(steps));
		EXPECT_DOUBLE_EQ(*values.begin(), plateau_value(profile, 1, steps));
		EXPECT_DOUBLE_EQ(*values.rbegin(), plateau_value(profile, steps, steps));
	}
}

TEST_F(CurveTest, Idempotent) {
	const std::time_t t = 6 * h + 42 * m;
	EXPECT_EQ(evaluate(t, morning, evening, profile, 7), evaluate(t, morning, evening, profile, 7));
}

TEST_F(CurveTest, StepsClamped) {
	const std::time_t t = 6 * h + 10 * m;
	EXPECT_EQ(evaluate(t, morning, evening, profile, 0), evaluate(t, morning, evening, profile, 1));
	EXPECT_EQ(evaluate(t, morning, evening, profile, 25), evaluate(t, morning, evening, profile, 10));
}

TEST_F(CurveTest, InvertedProfile) {
	const brightness_profile inverted {40, 80};
	EXPECT_EQ(evaluate(0, morning, evening, inverted, 4), 80);
	EXPECT_EQ(evaluate(12 * h, morning, evening, inverted, 4), 40);
	double prev = 80;
	for (std::time_t t = morning.start(); t < morning.end(); t += 60) {
		const double val = evaluate(t, morning, evening, inverted, 4);
		EXPECT_LE(val, prev);
		EXPECT_GT(val, 40);
		EXPECT_LT(val, 80);
		prev = val;
	}
}

TEST_F(CurveTest, FlatProfile) {
	const brightness_profile flat {70, 70};
	for (std::time_t t = 0; t < 24 * h; t += 15 * m) {
		EXPECT_DOUBLE_EQ(evaluate(t, morning, evening, flat, 3), 70);
	}
}

TEST_F(CurveTest, SingleStepPlateau) {
	EXPECT_DOUBLE_EQ(evaluate(6 * h, morning, evening, profile, 1), 80);
	EXPECT_DOUBLE_EQ(evaluate(7 * h - 1, morning, evening, profile, 1), 80);
	EXPECT_DOUBLE_EQ(evaluate(20 * h, morning, evening, profile, 1), 80);
}

TEST_F(CurveTest, SingleStepJump) {
	EXPECT_EQ(evaluate(6 * h - 1, morning, evening, profile, 1, step_mode::JUMP), 60);
	EXPECT_EQ(evaluate(6 * h, morning, evening, profile, 1, step_mode::JUMP), 100);
	EXPECT_EQ(evaluate(21 * h - 1, morning, evening, profile, 1, step_mode::JUMP), 100);
	EXPECT_EQ(evaluate(21 * h, morning, evening, profile, 1, step_mode::JUMP), 60);

	// only a single step jumps
	EXPECT_NEAR(evaluate(6 * h, morning, evening, profile, 2, step_mode::JUMP), 73.333, 0.001);
}

TEST_F(CurveTest, OverlapMorningWins) {
	const transition_window m_win {8 * h, 11 * h};
	const transition_window e_win {9 * h, 12 * h};

	// inside both windows: the morning staircase
	EXPECT_DOUBLE_EQ(evaluate(10 * h, m_win, e_win, profile, 3), plateau_value(profile, 3, 3));
	// after the morning window: the evening staircase
	EXPECT_DOUBLE_EQ(evaluate(11 * h, m_win, e_win, profile, 3), plateau_value(profile, 1, 3));
	EXPECT_EQ(evaluate(12 * h, m_win, e_win, profile, 3), 60);
}

TEST_F(CurveTest, EmptyWindows) {
	const transition_window m_win {7 * h, 7 * h};
	const transition_window e_win {19 * h, 19 * h};
	EXPECT_EQ(evaluate(7 * h - 1, m_win, e_win, profile, 5), 60);
	EXPECT_EQ(evaluate(7 * h, m_win, e_win, profile, 5), 100);
	EXPECT_EQ(evaluate(19 * h - 1, m_win, e_win, profile, 5), 100);
	EXPECT_EQ(evaluate(19 * h, m_win, e_win, profile, 5), 60);
}

TEST(StepMode, Names) {
	EXPECT_EQ(step_mode_from_name("plateau"), step_mode::PLATEAU);
	EXPECT_EQ(step_mode_from_name("jump"), step_mode::JUMP);
	EXPECT_EQ(step_mode_name(step_mode::JUMP), "jump");
	EXPECT_THROW(step_mode_from_name("instant"), std::invalid_argument);
}
