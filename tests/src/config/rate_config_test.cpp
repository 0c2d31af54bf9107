#include <gtest/gtest.h>
#include <tally/config/rate_config.hpp>

using tally::schema::transaction_error_code;

namespace {

tally::schema::rate_config_t make_config() {
  return tally::schema::rate_config_t{.apy_basis_points = 500,
                                      .max_apy_basis_points = 2000,
                                      .epochs_per_year = 365};
}

}  // namespace

TEST(rate_config, accepts_well_formed_config) {
  EXPECT_EQ(tally::config::validate(make_config()), transaction_error_code::ok);
  EXPECT_EQ(tally::config::validate_genesis(make_config()),
            transaction_error_code::ok);
}

TEST(rate_config, rejects_zero_epochs_per_year) {
  auto config = make_config();
  config.epochs_per_year = 0;
  EXPECT_EQ(tally::config::validate(config),
            transaction_error_code::invalid_rate);
}

TEST(rate_config, rejects_rate_above_ceiling) {
  auto config = make_config();
  config.apy_basis_points = 2001;
  EXPECT_EQ(tally::config::validate(config),
            transaction_error_code::invalid_rate);
}

TEST(rate_config, rejects_unknown_version) {
  auto config = make_config();
  config.version = 2;
  EXPECT_EQ(tally::config::validate(config),
            transaction_error_code::invalid_rate);
}

TEST(rate_config, genesis_caps_ceiling_at_one_hundred_percent) {
  auto config = make_config();
  config.max_apy_basis_points = 10001;
  EXPECT_EQ(tally::config::validate(config), transaction_error_code::ok);
  EXPECT_EQ(tally::config::validate_genesis(config),
            transaction_error_code::invalid_rate);
}

TEST(rate_config, set_rate_applies_valid_rate) {
  auto config = make_config();
  EXPECT_EQ(tally::config::set_rate(config, 2000), transaction_error_code::ok);
  EXPECT_EQ(config.apy_basis_points, 2000u);
  EXPECT_EQ(tally::config::set_rate(config, 0), transaction_error_code::ok);
  EXPECT_EQ(config.apy_basis_points, 0u);
}

TEST(rate_config, set_rate_rejection_leaves_config_untouched) {
  auto config = make_config();
  EXPECT_EQ(tally::config::set_rate(config, 2500),
            transaction_error_code::invalid_rate);
  EXPECT_EQ(config.apy_basis_points, 500u);
  EXPECT_EQ(config.max_apy_basis_points, 2000u);
}
