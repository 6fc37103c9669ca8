#ifndef VALIDATOR_HPP
#define VALIDATOR_HPP
#include <memory>
#include <string>
#include <vector>

#include <jsoncons/json.hpp>
#include <jsoncons_ext/jsonschema/jsonschema.hpp>
using SchemaPtr =
    std::shared_ptr<jsoncons::jsonschema::json_schema<jsoncons::json>>;
/**
 * @brief 按 schema 校验 batch/plan 文档, 每条错误以文档类型开头
 *
 */
class SchemaValidator {
 public:
  static std::vector<std::string> validate(const jsoncons::json& obj,
                                           SchemaPtr schema,
                                           const std::string& kind) {
    std::vector<std::string> errors;
    if (!obj.is_object()) {
      errors.push_back(kind + ": document is not a json object");
      return errors;
    }
    try {
      auto reporter =
          [&errors, &kind](const jsoncons::jsonschema::validation_output& o) {
            auto t = o.instance_location() + ": " + o.message();
            errors.push_back(kind + " " + t);
            return jsoncons::jsonschema::walk_result::advance;
          };
      jsoncons::jsonschema::json_validator<jsoncons::json> vad(schema);
      vad.validate(obj, reporter);
      return errors;
    } catch (std::exception& ec) {
      errors.push_back(kind + ": schema validation failed, " + ec.what());
      return errors;
    }
  }
};
#endif
