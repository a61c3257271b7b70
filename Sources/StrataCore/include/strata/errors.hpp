#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// Raised by the engine adapter (prepare/step/open failures)
class engine_error : public db_error {
public:
    explicit engine_error(const std::string& msg) : db_error(msg) {}
};

// No database factory has been registered
class engine_unavailable_error : public db_error {
public:
    engine_unavailable_error()
        : db_error("No database factory registered; call strata::init() first") {}
};

// Malformed table definition or record contract
class schema_error : public db_error {
public:
    explicit schema_error(const std::string& msg) : db_error(msg) {}
};

// CREATE TABLE on an existing table without if_not_exists
class schema_conflict_error : public db_error {
public:
    explicit schema_conflict_error(std::string table)
        : db_error("Table already exists: " + table), table_(std::move(table)) {}

    const std::string& table_name() const { return table_; }

private:
    std::string table_;
};

// A host value cannot be represented in the requested column type
class value_conversion_error : public db_error {
public:
    explicit value_conversion_error(const std::string& msg) : db_error(msg) {}
};

enum class decoding_error_kind {
    key_not_found,     // field absent from the row
    value_not_found,   // field present but null, target is not optional
    type_mismatch,     // raw value cannot become the target type
    data_corrupted     // unsupported container shape
};

// Field-level failure while decoding a row into a host type
class decoding_error : public db_error {
public:
    decoding_error(decoding_error_kind k, std::string field, std::string target_type,
                   std::vector<std::string> available_columns, const std::string& msg)
        : db_error(msg), kind_(k), field_(std::move(field)), target_type_(std::move(target_type)),
          available_columns_(std::move(available_columns)) {}

    decoding_error_kind kind() const { return kind_; }
    const std::string& field() const { return field_; }
    const std::string& target_type() const { return target_type_; }
    const std::vector<std::string>& available_columns() const { return available_columns_; }

private:
    decoding_error_kind kind_;
    std::string field_;
    std::string target_type_;
    std::vector<std::string> available_columns_;
};

// A whole row could not be turned into a record
class record_conversion_error : public db_error {
public:
    record_conversion_error(std::string type_name,
                            std::vector<std::string> available_columns,
                            const std::string& cause)
        : db_error(make_message(type_name, available_columns, cause)),
          type_name_(std::move(type_name)),
          available_columns_(std::move(available_columns)) {}

    const std::string& type_name() const { return type_name_; }
    const std::vector<std::string>& available_columns() const { return available_columns_; }

private:
    static std::string make_message(const std::string& type_name,
                                    const std::vector<std::string>& columns,
                                    const std::string& cause) {
        std::string msg = "Failed to decode " + type_name + " from database row. Available columns: ";
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += columns[i];
        }
        msg += ". Error: " + cause;
        return msg;
    }

    std::string type_name_;
    std::vector<std::string> available_columns_;
};

} // namespace strata

#endif // __cplusplus
