#include "strata/direct_decoder.hpp"
#include "strata/log.hpp"

namespace strata {

decode_context::decode_context(const value_map& values, const table_definition* definition, bool auto_infer)
    : source_(&values), definition_(definition), auto_infer_(auto_infer) {}

decode_context::decode_context(const row& source, const table_definition* definition, bool auto_infer)
    : source_(&source), definition_(definition), auto_infer_(auto_infer) {}

std::optional<storage_value> decode_context::lookup(const std::string& field) const {
    if (auto values = std::get_if<const value_map*>(&source_)) {
        auto it = (*values)->find(field);
        if (it == (*values)->end()) return std::nullopt;
        return it->second;
    }
    return std::get<const row*>(source_)->get(field);
}

bool decode_context::contains(const std::string& field) const {
    return lookup(field).has_value();
}

bool decode_context::is_nil(const std::string& field) const {
    auto raw = lookup(field);
    return !raw || is_null(*raw);
}

std::vector<std::string> decode_context::all_fields() const {
    if (auto values = std::get_if<const value_map*>(&source_)) {
        std::vector<std::string> names;
        names.reserve((*values)->size());
        for (const auto& [name, _] : **values) {
            names.push_back(name);
        }
        return names;
    }
    return std::get<const row*>(source_)->column_names();
}

type_inference decode_context::resolve(const std::string& field, const storage_value& raw) const {
    if (definition_) {
        if (const auto* column = definition_->find_column(field)) {
            return {column->type, !column->is_not_null};
        }
    }
    return infer_type(raw);
}

bool decode_context::infer_for(const std::string& field) const {
    // Declared columns decode strictly
    if (definition_ && definition_->find_column(field)) {
        return false;
    }
    return auto_infer_;
}

void decode_context::fail(decoding_error_kind kind, const std::string& field,
                          const std::string& target_type, const std::string& msg) const {
    STRATA_LOG_DEBUG("decode", "%s", msg.c_str());
    throw decoding_error(kind, field, target_type, all_fields(), msg);
}

} // namespace strata
