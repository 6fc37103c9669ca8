#ifndef CODEC_HPP
#define CODEC_HPP
#include <jsoncons/json.hpp>

#include "../error.hpp"
#include "./model/wave.hpp"
#include "./plan/plan.hpp"
namespace data {
namespace codec {
using json = jsoncons::json;
/**
 * @brief 批次文档 {waveStart, orders, workers, equipment} 解码为波次,
 * 先做 schema 校验, 任何不合法都抛 error::InvalidInput 并列出全部问题
 *
 */
model::Wave wave_from_json(const json& doc);
model::Wave parse_wave(const std::string& text);

// 计划文档, 基线计划使用同一格式
json plan_to_json(const plan::Plan& p);
plan::Plan plan_from_json(const json& doc);
plan::Plan parse_plan(const std::string& text);

json usage_to_json(const plan::ResourceUsage& u);
}  // namespace codec
}  // namespace data
#endif
