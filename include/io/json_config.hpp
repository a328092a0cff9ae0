// io/json_config.hpp
#pragma once
#include <map>
#include <string>
#include <nlohmann/json.hpp>

#include "reg/parameter_model.hpp"
#include "reg/register_schema.hpp"
#include "reg/schema_registry.hpp"

/* All comments are in English.
 * JSON front end of the register model.
 *
 * A register block is a JSON object of named values plus optional meta keys:
 *   {
 *     "kind": "offline_neuron",        // default "offline_core"
 *     "name": "core_0_0",              // block name when the file holds one block
 *     "neuron_group_size": 4,          // neuron kinds only, default 1
 *     "weight_width": 8,               // online neurons: owning core's precision
 *     "reset_mode": "MODE_NORMAL",     // enum fields take a label or a value
 *     "leak_v": [1, 2, 3, 4],          // array fields: one value per neuron
 *     ...
 *   }
 * A file holds either one block or an object mapping names to blocks.
 */

namespace pc { namespace io {

// Throws std::runtime_error if the file cannot be opened or parsed.
nlohmann::json ReadJsonFile(const std::string& path);
void WriteJsonFile(const std::string& path, const nlohmann::json& j);

// Named values of one block, meta keys removed. Labels are resolved against
// `schema`; bad values are aggregated into one RegisterError.
reg::NamedValues ToNamedValues(const nlohmann::json& block, const reg::RegisterSchema& schema);

reg::ParameterModel LoadModel(const nlohmann::json& block,
                              const reg::SchemaRegistry& registry = reg::SchemaRegistry::Default());

std::map<std::string, reg::ParameterModel> LoadModels(
    const std::string& path,
    const reg::SchemaRegistry& registry = reg::SchemaRegistry::Default());

// Writes { "<name>": <Export()>, ... }.
void SaveExport(const std::string& path, const std::map<std::string, reg::ParameterModel>& models);

}} // namespace pc::io
