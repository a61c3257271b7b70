#include "strata/schema.hpp"
#include <cctype>

namespace strata {

table_definition::table_definition(std::string name, std::vector<column_def> columns, table_options options)
    : name_(std::move(name)), columns_(std::move(columns)), options_(options) {
    if (name_.empty()) {
        throw schema_error("Table definition requires a name");
    }
    for (size_t i = 0; i < columns_.size(); ++i) {
        const auto& col = columns_[i];
        if (col.name.empty()) {
            throw schema_error("Table " + name_ + " has a column without a name");
        }
        if (!index_.emplace(col.name, i).second) {
            throw schema_error("Duplicate column '" + col.name + "' in table " + name_);
        }
    }
}

const column_def* table_definition::find_column(const std::string& column) const {
    auto it = index_.find(column);
    if (it == index_.end()) return nullptr;
    return &columns_[it->second];
}

namespace detail {

std::string default_table_name(const char* type_name) {
    std::string name(type_name);
    auto pos = name.rfind("::");
    if (pos != std::string::npos) {
        name = name.substr(pos + 2);
    }
    for (char& c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return name;
}

} // namespace detail
} // namespace strata
