#include <schemadex/catalog/descriptors.h>

namespace schemadex::catalog {

void to_json(nlohmann::json& j, const TableDescriptor& t) {
    j = nlohmann::json{{"schema", t.schema}, {"name", t.name}, {"remarks", t.remarks}};
}

void from_json(const nlohmann::json& j, TableDescriptor& t) {
    t.schema = j.at("schema").get<std::string>();
    t.name = j.at("name").get<std::string>();
    t.remarks = j.value("remarks", std::string{});
}

void to_json(nlohmann::json& j, const ColumnDescriptor& c) {
    j = nlohmann::json{{"schema", c.schema},
                       {"table", c.table},
                       {"name", c.name},
                       {"type_name", c.typeName},
                       {"length", nullptr},
                       {"scale", nullptr},
                       {"nullable", nullableFlag(c.nullable)},
                       {"remarks", c.remarks}};
    if (c.length)
        j["length"] = *c.length;
    if (c.scale)
        j["scale"] = *c.scale;
}

void from_json(const nlohmann::json& j, ColumnDescriptor& c) {
    c.schema = j.at("schema").get<std::string>();
    c.table = j.at("table").get<std::string>();
    c.name = j.at("name").get<std::string>();
    c.typeName = j.value("type_name", std::string{});

    c.length.reset();
    if (auto it = j.find("length"); it != j.end() && it->is_number_integer())
        c.length = it->get<int64_t>();
    c.scale.reset();
    if (auto it = j.find("scale"); it != j.end() && it->is_number_integer())
        c.scale = it->get<int64_t>();

    c.nullable = j.value("nullable", std::string{"N"}) == "Y" ? Nullable::Yes : Nullable::No;
    c.remarks = j.value("remarks", std::string{});
}

} // namespace schemadex::catalog
