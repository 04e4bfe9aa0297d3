#ifndef TOMLENC_TEST_ENCODER_FIXTURE_HPP
#define TOMLENC_TEST_ENCODER_FIXTURE_HPP

#include "encoder/encoder.hpp"
#include "io/write.hpp"
#include "runtime/value.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

struct encoder_fixture : testing::Test {
  tomlenc::encoder enc;

  // Dispatch a single value through the given encoder, as it would be
  // formatted on the right-hand side of an assignment.
  std::string
  format(tomlenc::value const& v, tomlenc::encoder const& e) {
    tomlenc::format_context ctx{e};
    return ctx.format(v);
  }

  std::string
  format(tomlenc::value const& v) { return format(v, enc); }

  std::string
  render(std::shared_ptr<tomlenc::table> const& root,
         tomlenc::encoder const* e = nullptr) {
    return tomlenc::render(*root, e);
  }

  testing::AssertionResult
  renders_as(std::shared_ptr<tomlenc::table> const& root,
             std::string const& expected,
             tomlenc::encoder const* e = nullptr);
};

#endif
