#include "faultline/config.hpp"
#include "faultline/core/lexical.hpp"
#include "faultline/core/platform_utils.hpp"
#include "faultline/error.hpp"
#include "faultline/error_mapping.hpp"
#include "faultline/expected.hpp"
#include "faultline/io/storage.hpp"
#include "faultline/math/domain_ops.hpp"
#include "faultline/pipeline/chain.hpp"
#include "faultline/pipeline/scaled_root.hpp"
#include "faultline/platform/filesystem.hpp"
#include <iostream>

int main() {
  auto c = faultline::default_config(); (void)c;
  auto r = faultline::pipeline::chain(4.0, [](double x){ return faultline::math::sqrt(x); }); (void)r;
  std::cout << "Headers compile" << std::endl;
  return 0;
}
