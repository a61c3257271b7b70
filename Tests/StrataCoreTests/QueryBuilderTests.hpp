#pragma once

#include "TestModels.hpp"
#include <cassert>
#include <iostream>

namespace query_builder_tests {

using namespace strata;

storage_value text(const char* s) { return storage_value{std::string(s)}; }
storage_value integer(int64_t v) { return storage_value{v}; }

// ============================================================================
// test_filters: one clause per operator
// ============================================================================

void test_filters() {
    std::cout << "  test_filters..." << std::flush;

    auto eq = query_filter::equals("name", "Alice").build();
    assert(eq.clause == "name = ?");
    assert(eq.args.size() == 1 && eq.args[0] == text("Alice"));

    auto ne = query_filter::not_equals("age", 30).build();
    assert(ne.clause == "age != ?");
    assert(ne.args[0] == integer(30));

    auto like = query_filter::like("email", "%@example.com").build();
    assert(like.clause == "email LIKE ?");
    assert(like.args[0] == text("%@example.com"));

    auto gt = query_filter::greater_than("score", 90.5).build();
    assert(gt.clause == "score > ?");
    assert(gt.args[0] == storage_value{90.5});

    auto cutoff = timestamp_from_seconds(1700000000.0);
    auto lt = query_filter::less_than("createdAt", cutoff).build();
    assert(lt.clause == "createdAt < ?");
    assert(std::get<timestamp_t>(lt.args[0]) == cutoff);

    auto in = query_filter::in_set("id", std::vector<int>{1, 2, 3}).build();
    assert(in.clause == "id IN (?, ?, ?)");
    assert(in.args.size() == 3);
    assert(in.args[0] == integer(1) && in.args[2] == integer(3));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_empty_in_set: matches nothing, binds nothing
// ============================================================================

void test_empty_in_set() {
    std::cout << "  test_empty_in_set..." << std::flush;

    auto clause = query_filter::in_set("id", {}).build();
    assert(clause.clause == "1=0");
    assert(clause.args.empty());

    action::select filtered;
    filtered.filters.push_back(query_filter::in_set("id", std::vector<std::string>{}));
    auto compiled = query{"users", filtered}.build();
    assert(compiled.sql == "SELECT * FROM users WHERE 1=0");
    assert(compiled.args.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_sort: multi-key ORDER BY
// ============================================================================

void test_sort() {
    std::cout << "  test_sort..." << std::flush;

    query_sort by_name(std::vector<sort_field>{{"lastName", sort_order::ascending},
                                             {"firstName", sort_order::ascending}});
    assert(by_name.build() == "ORDER BY lastName ASC, firstName ASC");

    query_sort newest("createdAt", sort_order::descending);
    assert(newest.build() == "ORDER BY createdAt DESC");

    query_sort default_order("id");
    assert(default_order.build() == "ORDER BY id ASC");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_select: projection, filters, sort, paging
// ============================================================================

void test_select() {
    std::cout << "  test_select..." << std::flush;

    assert((query{"users", action::select{}}.build().sql == "SELECT * FROM users"));

    action::select projection;
    projection.fields = {"id", "name", "price"};
    assert((query{"products", projection}.build().sql == "SELECT id, name, price FROM products"));

    action::select paged;
    paged.filters = {query_filter::greater_than("age", 18), query_filter::like("name", "A%")};
    paged.sort = query_sort("name");
    paged.limit = 10;
    paged.offset = 20;
    auto compiled = query{"users", paged}.build();
    assert(compiled.sql == "SELECT * FROM users WHERE age > ? AND name LIKE ? ORDER BY name ASC LIMIT 10 OFFSET 20");
    assert(compiled.args.size() == 2);
    assert(compiled.args[0] == integer(18));
    assert(compiled.args[1] == text("A%"));

    action::select offset_only;
    offset_only.offset = 5;
    assert((query{"users", offset_only}.build().sql == "SELECT * FROM users OFFSET 5"));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_insert: sorted columns, deterministic output
// ============================================================================

void test_insert() {
    std::cout << "  test_insert..." << std::flush;

    value_map values;
    values["name"] = text("Alice");
    values["age"] = integer(30);
    values["email"] = text("alice@example.com");

    query q{"users", action::insert{values}};
    auto compiled = q.build();
    assert(compiled.sql == "INSERT INTO users (age, email, name) VALUES (?, ?, ?)");
    assert(compiled.args.size() == 3);
    assert(compiled.args[0] == integer(30));
    assert(compiled.args[1] == text("alice@example.com"));
    assert(compiled.args[2] == text("Alice"));

    // Same input, same output
    auto again = q.build();
    assert(again.sql == compiled.sql);
    assert(again.args == compiled.args);

    // Nothing to insert compiles to nothing
    auto empty = query{"users", action::insert{}}.build();
    assert(empty.sql.empty());
    assert(empty.args.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_insert_many: union of keys, NULL for missing columns
// ============================================================================

void test_insert_many() {
    std::cout << "  test_insert_many..." << std::flush;

    value_map first{{"id", integer(1)}, {"name", text("A")}};
    value_map second{{"id", integer(2)}, {"email", text("b@x")}};

    auto compiled = query{"users", action::insert_many{{first, second}}}.build();
    assert(compiled.sql == "INSERT INTO users (email, id, name) VALUES (?, ?, ?), (?, ?, ?)");
    assert(compiled.args.size() == 6);
    assert(is_null(compiled.args[0]));
    assert(compiled.args[1] == integer(1));
    assert(compiled.args[2] == text("A"));
    assert(compiled.args[3] == text("b@x"));
    assert(compiled.args[4] == integer(2));
    assert(is_null(compiled.args[5]));

    auto empty = query{"users", action::insert_many{}}.build();
    assert(empty.sql.empty());
    assert(empty.args.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_update: SET args before WHERE args
// ============================================================================

void test_update() {
    std::cout << "  test_update..." << std::flush;

    action::update update;
    update.values = {{"name", text("Bob")}, {"age", integer(31)}};
    update.filters.push_back(query_filter::equals("id", 1));

    auto compiled = query{"users", update}.build();
    assert(compiled.sql == "UPDATE users SET age = ?, name = ? WHERE id = ?");
    assert(compiled.args.size() == 3);
    assert(compiled.args[0] == integer(31));
    assert(compiled.args[1] == text("Bob"));
    assert(compiled.args[2] == integer(1));

    update.filters.clear();
    assert((query{"users", update}.build().sql == "UPDATE users SET age = ?, name = ?"));

    // No assignments, no statement
    action::update nothing;
    nothing.filters.push_back(query_filter::equals("id", 1));
    auto skipped = query{"users", nothing}.build();
    assert(skipped.sql.empty());
    assert(skipped.args.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_remove: DELETE with and without filters, batched by id
// ============================================================================

void test_remove() {
    std::cout << "  test_remove..." << std::flush;

    assert((query{"users", action::remove{}}.build().sql == "DELETE FROM users"));

    action::remove one;
    one.filters.push_back(query_filter::equals("id", 1));
    auto compiled = query{"users", one}.build();
    assert(compiled.sql == "DELETE FROM users WHERE id = ?");
    assert(compiled.args.size() == 1);

    action::remove_many batch{"id", {integer(1), integer(2)}};
    auto many = query{"users", batch}.build();
    assert(many.sql == "DELETE FROM users WHERE id IN (?, ?)");
    assert(many.args.size() == 2);

    auto none = query{"users", action::remove_many{"id", {}}}.build();
    assert(none.sql == "DELETE FROM users WHERE 1=0");
    assert(none.args.empty());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_upsert: conflict target and update column selection
// ============================================================================

void test_upsert() {
    std::cout << "  test_upsert..." << std::flush;

    value_map values{{"id", integer(1)}, {"a", text("x")}, {"b", text("y")}};

    action::upsert all;
    all.values = values;
    all.conflict_columns = {"id"};
    auto compiled = query{"t", all}.build();
    assert(compiled.sql ==
           "INSERT INTO t (a, b, id) VALUES (?, ?, ?) ON CONFLICT(id) DO UPDATE SET a = excluded.a, b = excluded.b");
    assert(compiled.args.size() == 3);
    assert(compiled.args[2] == integer(1));

    action::upsert only_b = all;
    only_b.update_columns = std::vector<std::string>{"b"};
    assert((query{"t", only_b}.build().sql ==
           "INSERT INTO t (a, b, id) VALUES (?, ?, ?) ON CONFLICT(id) DO UPDATE SET b = excluded.b"));

    // Explicit update columns are emitted in sorted order
    action::upsert unsorted = all;
    unsorted.values["c"] = text("z");
    unsorted.update_columns = std::vector<std::string>{"c", "a"};
    assert((query{"t", unsorted}.build().sql ==
           "INSERT INTO t (a, b, c, id) VALUES (?, ?, ?, ?) ON CONFLICT(id) DO UPDATE SET a = excluded.a, c = excluded.c"));

    // Nothing left to update
    action::upsert id_only;
    id_only.values = {{"id", integer(1)}};
    id_only.conflict_columns = {"id"};
    assert((query{"t", id_only}.build().sql == "INSERT INTO t (id) VALUES (?) ON CONFLICT(id) DO NOTHING"));

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Query Builder Tests ---" << std::endl;

    test_filters();
    test_empty_in_set();
    test_sort();
    test_select();
    test_insert();
    test_insert_many();
    test_update();
    test_remove();
    test_upsert();

    std::cout << "--- Query Builder Tests: All passed ---" << std::endl;
}

} // namespace query_builder_tests
