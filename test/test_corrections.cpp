/**
 * @file test_corrections.cpp
 * @brief Unit tests for the wind load.
 */

#include <gtest/gtest.h>
#include "../lib/ctk/src/corrections/wind.h"
#include "ctk/ctk_config.h"

// Positive wind blows back toward the launcher
TEST(WindTest, PositiveWindOpposesFlight) {
    EXPECT_DOUBLE_EQ(WindCorrection::horizontalForce(5.0), -5.0);
}

TEST(WindTest, NegativeWindAssistsFlight) {
    EXPECT_DOUBLE_EQ(WindCorrection::horizontalForce(-12.5), 12.5);
}

TEST(WindTest, ZeroWindNoForce) {
    EXPECT_DOUBLE_EQ(WindCorrection::horizontalForce(0.0), 0.0);
}

TEST(WindTest, ClampInsideDomainUnchanged) {
    double w = 7.3;
    EXPECT_TRUE(WindCorrection::clampToDomain(w));
    EXPECT_DOUBLE_EQ(w, 7.3);
}

TEST(WindTest, ClampOutsideDomain) {
    double high = 35.0;
    EXPECT_FALSE(WindCorrection::clampToDomain(high));
    EXPECT_DOUBLE_EQ(high, CTK_WIND_MAX_MS);

    double low = -21.0;
    EXPECT_FALSE(WindCorrection::clampToDomain(low));
    EXPECT_DOUBLE_EQ(low, CTK_WIND_MIN_MS);
}
