#include "test_helpers.hpp"
#include <findiff/io/config_manager.hpp>
#include <memory>
#include <string>

using namespace findiff;

int main() {
  // File-based configuration drives a full request.
  io::ConfigurationManager manager;
  auto loaded = manager.load("config/rosenbrock.yaml");
  test::expect(loaded.has_value(), "configuration file loads");
  if (loaded) {
    test::expect(loaded->derivative.sizes.size() == 2 && loaded->derivative.sizes[1] == 1.0e-5, "sizes parsed");
    test::expect(loaded->derivative.methods == std::vector<std::string>{"forward", "backward"}, "methods parsed");
    test::expect(loaded->derivative.success.rtol == 1.0e-2, "rtol parsed");
    test::expect(!loaded->derivative.directions.has_value(), "standard basis by default");
    test::expect(manager.current().has_value(), "manager keeps the current configuration");

    auto options = io::make_options(*loaded);
    test::expect(options.has_value(), "options built");
    if (options) {
      test::expect(options->analyses.size() == 1, "analysis instantiated");
      auto consistency = std::dynamic_pointer_cast<const success::Consistency>(options->success_evaluator);
      test::expect(consistency != nullptr, "consistency policy instantiated");
      if (consistency) {
        test::expect(consistency->rtol() == 1.0e-2 && consistency->atol() == 1.0e-15, "tolerances passed through");
        test::expect(consistency->grouping_key() == success::GroupingKey::Size, "grouping key passed through");
      }
      auto result = engine::differentiate_scalar(test::rosenbrock, Eigen::Vector3d(1.0, 0.0, 0.0), *options);
      test::expect(result && result->success(), "configured request succeeds");
      if (result) {
        test::expect(test::near(result->value()(1), -202.0, 1e-2), "configured gradient");
      }
    }
  }

  test::expect(!manager.load("config/does_not_exist.yaml").has_value(), "missing file is an error");

  // In-memory documents, custom directions and case-insensitive names.
  auto inline_config = manager.load_from_string(R"(
derivative:
  sizes: [0.001]
  methods: [Central, CENTRAL5]
  directions:
    - id: diagonal
      vector: [1.0, 1.0]
  success:
    group_by: method
  failure_policy: partial
  verbose: true
)");
  test::expect(inline_config.has_value(), "in-memory configuration loads");
  if (inline_config) {
    const auto& derivative = inline_config->derivative;
    test::expect(derivative.methods == std::vector<std::string>{"central", "central5"}, "method names lowercased");
    test::expect(derivative.directions && derivative.directions->size() == 1, "directions parsed");
    test::expect(derivative.success.group_by == success::GroupingKey::Id, "group_by parsed");
    test::expect(derivative.success.rtol == constants::tolerance::default_rtol, "default rtol kept");
    test::expect(derivative.failure_policy == computation::FailurePolicy::Partial, "failure policy parsed");
    test::expect(inline_config->verbose, "verbose flag parsed");

    auto options = io::make_options(*inline_config);
    test::expect(options && options->directions && (*options->directions)[0].vector.size() == 2, "direction copied");
  }

  // Rejected documents.
  test::expect(!manager.load_from_string("solver: {}\n").has_value(), "missing derivative section");
  test::expect(!manager.load_from_string("derivative:\n  methods: [forward]\n").has_value(), "missing sizes");
  test::expect(!manager.load_from_string("derivative:\n  sizes: 0.1\n  methods: [forward]\n").has_value(),
               "sizes must be a sequence");
  test::expect(!manager.load_from_string("derivative:\n  sizes: [0.1]\n  methods: [forward]\n  failure_policy: retry\n")
                    .has_value(),
               "unknown failure policy");
  test::expect(!manager.load_from_string("derivative:\n  sizes: [0.1]\n  methods: [forward]\n  directions:\n"
                                         "    - {id: a, vector: [1.0]}\n    - {id: a, vector: [0.0]}\n")
                    .has_value(),
               "duplicate direction ids");
  test::expect(!manager.load_from_string("derivative: [unterminated\n").has_value(), "malformed YAML");

  // Semantic checks happen when options are built.
  auto bad_tolerance = manager.load_from_string("derivative:\n  sizes: [0.1]\n  methods: [forward]\n"
                                                "  success:\n    rtol: -1.0\n");
  test::expect(bad_tolerance.has_value(), "negative rtol parses");
  if (bad_tolerance) {
    test::expect(!io::make_options(*bad_tolerance).has_value(), "negative rtol rejected");
  }
  auto bad_analysis = manager.load_from_string("derivative:\n  sizes: [0.1]\n  methods: [forward]\n"
                                               "  analyses: [richardson]\n");
  test::expect(bad_analysis && !io::make_options(*bad_analysis).has_value(), "unknown analysis rejected");

  return test::finish();
}
