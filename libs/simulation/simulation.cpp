/**
 * @file simulation.cpp
 * @brief Simulation result validation and JSON mapping
 */

#include "sorocost/simulation.hpp"

#include "sorocost/json_io.hpp"
#include "sorocost/schema_validate.hpp"

#include <format>
#include <limits>
#include <ranges>
#include <string_view>
#include <utility>

namespace sorocost::simulation {

namespace {

[[nodiscard]] sorocost::Error input_error(std::string message)
{
    return sorocost::Error::make(kInvalidInputError, std::move(message));
}

[[nodiscard]] sorocost::Result<std::int64_t> read_counter(const nlohmann::json& obj,
                                                          std::string_view path,
                                                          std::string_view key)
{
    const auto it = obj.find(std::string(key));
    if (it == obj.end()) {
        return std::unexpected(
            input_error("Missing field: " + std::string(path) + "." + std::string(key)));
    }
    if (it->is_number_unsigned()) {
        const auto raw = it->get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::unexpected(input_error("Field out of range: " + std::string(path) + "."
                                               + std::string(key)));
        }
        return static_cast<std::int64_t>(raw);
    }
    if (!it->is_number_integer()) {
        return std::unexpected(input_error("Field must be an integer: " + std::string(path)
                                           + "." + std::string(key)));
    }
    return it->get<std::int64_t>();
}

[[nodiscard]] sorocost::Result<std::vector<std::string>>
read_keys(const nlohmann::json& footprint, std::string_view key)
{
    std::vector<std::string> keys;
    const auto it = footprint.find(std::string(key));
    if (it == footprint.end()) {
        return keys;
    }
    const std::string path = "$.resources.footprint." + std::string(key);
    if (!it->is_array()) {
        return std::unexpected(input_error("Footprint list must be an array: " + path));
    }
    keys.reserve(it->size());
    const auto& entries = it->get_ref<const nlohmann::json::array_t&>();
    for (const auto& [i, entry] : std::views::enumerate(entries)) {
        if (entry.is_null()) {
            return std::unexpected(
                input_error(std::format("Null footprint entry at {}[{}]", path, i)));
        }
        if (!entry.is_string()) {
            return std::unexpected(
                input_error(std::format("Footprint entry must be a string at {}[{}]", path, i)));
        }
        keys.push_back(entry.get<std::string>());
    }
    return keys;
}

[[nodiscard]] sorocost::VoidResult check_non_negative(std::int64_t value, std::string_view field)
{
    if (value < 0) {
        return std::unexpected(input_error("Negative value for " + std::string(field) + ": "
                                           + std::to_string(value)));
    }
    return {};
}

}  // namespace

sorocost::VoidResult validate_simulation(const SimulationResult& sim)
{
    const std::pair<std::int64_t, std::string_view> counters[] = {
        {                   sim.instructions,            "instructions"},
        {                   sim.memory_bytes,             "memoryBytes"},
        {         sim.resources.instructions,  "resources.instructions"},
        {           sim.resources.read_bytes,     "resources.readBytes"},
        {          sim.resources.write_bytes,    "resources.writeBytes"},
        {         sim.transaction_size_bytes,    "transactionSizeBytes"},
    };
    for (const auto& [value, field] : counters) {
        if (auto result = check_non_negative(value, field); !result) {
            return result;
        }
    }
    return {};
}

// NOLINTBEGIN(readability-function-size) - Field-by-field mapping kept together.
sorocost::Result<SimulationResult> simulation_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(input_error("Simulation result must be a JSON object"));
    }
    const auto resources_it = j.find("resources");
    if (resources_it == j.end() || !resources_it->is_object()) {
        return std::unexpected(input_error("Missing object field: $.resources"));
    }
    const auto& resources = *resources_it;
    const auto footprint_it = resources.find("footprint");
    if (footprint_it == resources.end() || !footprint_it->is_object()) {
        return std::unexpected(input_error("Missing object field: $.resources.footprint"));
    }

    SimulationResult sim;

    auto instructions = read_counter(j, "$", "instructions");
    if (!instructions) {
        return std::unexpected(instructions.error());
    }
    sim.instructions = *instructions;

    auto memory_bytes = read_counter(j, "$", "memoryBytes");
    if (!memory_bytes) {
        return std::unexpected(memory_bytes.error());
    }
    sim.memory_bytes = *memory_bytes;

    auto tx_size = read_counter(j, "$", "transactionSizeBytes");
    if (!tx_size) {
        return std::unexpected(tx_size.error());
    }
    sim.transaction_size_bytes = *tx_size;

    auto res_instructions = read_counter(resources, "$.resources", "instructions");
    if (!res_instructions) {
        return std::unexpected(res_instructions.error());
    }
    sim.resources.instructions = *res_instructions;

    auto read_bytes = read_counter(resources, "$.resources", "readBytes");
    if (!read_bytes) {
        return std::unexpected(read_bytes.error());
    }
    sim.resources.read_bytes = *read_bytes;

    auto write_bytes = read_counter(resources, "$.resources", "writeBytes");
    if (!write_bytes) {
        return std::unexpected(write_bytes.error());
    }
    sim.resources.write_bytes = *write_bytes;

    auto read_only = read_keys(*footprint_it, "readOnly");
    if (!read_only) {
        return std::unexpected(read_only.error());
    }
    sim.resources.footprint.read_only = std::move(*read_only);

    auto read_write = read_keys(*footprint_it, "readWrite");
    if (!read_write) {
        return std::unexpected(read_write.error());
    }
    sim.resources.footprint.read_write = std::move(*read_write);

    if (auto valid = validate_simulation(sim); !valid) {
        return std::unexpected(valid.error());
    }
    return sim;
}
// NOLINTEND(readability-function-size)

nlohmann::json simulation_to_json(const SimulationResult& sim)
{
    return nlohmann::json{
        {        "instructions",                  sim.instructions},
        {         "memoryBytes",                  sim.memory_bytes},
        {"transactionSizeBytes",        sim.transaction_size_bytes},
        {           "resources",
         {{"instructions", sim.resources.instructions},
         {"readBytes", sim.resources.read_bytes},
         {"writeBytes", sim.resources.write_bytes},
         {"footprint",
         {{"readOnly", sim.resources.footprint.read_only},
         {"readWrite", sim.resources.footprint.read_write}}}}}
    };
}

sorocost::Result<SimulationResult> load_simulation(const std::filesystem::path& path,
                                                   const std::string& schema_dir)
{
    auto payload = sorocost::common::read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    const std::filesystem::path schema_path =
        std::filesystem::path(schema_dir) / "simulation.v1.schema.json";
    if (auto validation = sorocost::common::validate_json(*payload, schema_path.string());
        !validation) {
        return std::unexpected(
            sorocost::Error::make(validation.error().code,
                                  "simulation schema validation failed: "
                                      + validation.error().message));
    }
    return simulation_from_json(*payload);
}

}  // namespace sorocost::simulation
