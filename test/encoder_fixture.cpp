#include "encoder_fixture.hpp"

testing::AssertionResult
encoder_fixture::renders_as(std::shared_ptr<tomlenc::table> const& root,
                            std::string const& expected,
                            tomlenc::encoder const* e) {
  std::string actual = render(root, e);
  if (actual == expected)
    return testing::AssertionSuccess();
  else
    return testing::AssertionFailure()
      << "rendered\n" << actual
      << "\nbut expected\n" << expected;
}
