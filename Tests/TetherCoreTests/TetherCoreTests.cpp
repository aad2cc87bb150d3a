#include <TetherCore.hpp>
#include <cassert>
#include <iostream>
#include <algorithm>
#include <cmath>

// ============================================================================
// Helpers
// ============================================================================

static tether::column_value_t text(const std::string& s) {
    return s;
}

static std::string name_of(const tether::record_ptr& r) {
    return std::get<std::string>(r->get("name"));
}

static tether::primary_key_t id_of(const tether::record_ptr& r) {
    return *r->id();
}

static void require_name(const tether::record& r, tether::error_list& errors) {
    if (tether::detail::is_blank(r.get("name"))) {
        errors.add("name", "can't be blank");
    }
}

// Post<suffix> has_many comments / Comment<suffix> belongs_to post, linked by post_id
struct blog_types {
    std::shared_ptr<tether::entity_type> post;
    std::shared_ptr<tether::entity_type> comment;
};

static blog_types define_blog(const std::string& suffix,
                              const nlohmann::json& comment_options = nlohmann::json::object()) {
    blog_types t;
    t.post = tether::entity_type::define("Post" + suffix, {{"title"}});
    t.comment = tether::entity_type::define("Comment" + suffix,
                                            {{"name"}, {"post_id", tether::column_type::integer}});

    nlohmann::json options = {{"className", "Comment" + suffix}, {"foreignKey", "post_id"}};
    options.update(comment_options);
    tether::builder::has_many(t.post, "comments", options);
    tether::builder::belongs_to(t.comment, "post", {{"className", "Post" + suffix}, {"foreignKey", "post_id"}});
    return t;
}

static tether::record_ptr saved_post(tether::tether_db& db, const blog_types& t, const std::string& title) {
    auto p = db.build(t.post, {{"title", text(title)}});
    db.save_or_throw(*p);
    return p;
}

// Counts statements SQLite starts on a connection
static int g_statements = 0;
static int count_statements(unsigned, void*, void*, void*) {
    ++g_statements;
    return 0;
}

// ============================================================================
// Test: load state transitions
// ============================================================================

void test_load_state_transitions() {
    std::cout << "Testing load state transitions..." << std::endl;

    using tether::load_state;
    using tether::load_event;

    assert(tether::next_state(load_state::not_loaded, load_event::loaded) == load_state::loaded);
    assert(tether::next_state(load_state::loaded, load_event::key_changed) == load_state::stale);
    assert(tether::next_state(load_state::stale, load_event::loaded) == load_state::loaded);
    assert(tether::next_state(load_state::not_loaded, load_event::key_changed) == load_state::not_loaded);

    for (auto s : {load_state::not_loaded, load_state::loaded, load_state::stale}) {
        assert(tether::next_state(s, load_event::reset) == load_state::not_loaded);
    }

    std::cout << "  Load state transitions test passed!" << std::endl;
}

// ============================================================================
// Test: declarations fail fast
// ============================================================================

void test_builder_rejects_bad_declarations() {
    std::cout << "Testing builder validation..." << std::endl;

    auto shelf = tether::entity_type::define("ShelfA", {{"label"}});

    auto expect_configuration_error = [](auto&& declare) {
        bool threw = false;
        try {
            declare();
        } catch (const tether::configuration_error&) {
            threw = true;
        }
        assert(threw);
    };

    // Unknown option key, before any instance exists
    expect_configuration_error([&] { tether::builder::has_many(shelf, "books", {{"fooBar", true}}); });
    assert(shelf->reflect_on_association("books") == nullptr);

    // eachSerializer and dependent belong to collections only
    expect_configuration_error([&] { tether::builder::belongs_to(shelf, "room", {{"eachSerializer", "x"}}); });
    expect_configuration_error([&] { tether::builder::belongs_to(shelf, "room", {{"dependent", "destroy"}}); });

    // Names must be plain identifiers
    expect_configuration_error([&] { tether::builder::has_many(shelf, "books; DROP", nullptr); });
    expect_configuration_error([&] { tether::builder::has_many(shelf, "9books", nullptr); });
    expect_configuration_error([&] { tether::builder::has_many(shelf, "", nullptr); });

    // Option values
    expect_configuration_error([&] { tether::builder::has_many(shelf, "books", {{"embed", "everything"}}); });
    expect_configuration_error([&] { tether::builder::has_many(shelf, "books", {{"dependent", "obliterate"}}); });
    expect_configuration_error([&] { tether::builder::has_many(shelf, "books", {{"only", 3}}); });
    expect_configuration_error([&] { tether::builder::has_many(shelf, "books", {{"className", 3}}); });
    expect_configuration_error([&] { tether::builder::has_many(shelf, "books", nlohmann::json::array()); });

    // A valid declaration goes through, a second one with the same name does not
    auto refl = tether::builder::has_many(shelf, "books", {{"embed", "ids"}, {"only", {"title"}}, {"dependent", "nullify"}});
    assert(refl->is_collection());
    assert(refl->dependent() == tether::dependent_policy::nullify);
    assert(refl->embeds_ids());
    assert(refl->only() == std::vector<std::string>{"title"});
    assert(shelf->reflect_on_association("books") == refl);
    expect_configuration_error([&] { tether::builder::has_many(shelf, "books", nullptr); });

    std::cout << "  Builder validation test passed!" << std::endl;
}

// ============================================================================
// Test: reflection defaults and inverse detection
// ============================================================================

void test_reflection_defaults() {
    std::cout << "Testing reflection defaults..." << std::endl;

    assert(tether::detail::classify("comments") == "Comment");
    assert(tether::detail::classify("blog_posts") == "BlogPost");
    assert(tether::detail::classify("categories") == "Category");
    assert(tether::detail::classify("addresses") == "Address");
    assert(tether::detail::underscore("BlogPost") == "blog_post");

    auto author = tether::entity_type::define("Writer", {{"name"}});
    auto essay = tether::entity_type::define("Essay", {{"name"}, {"writer_id", tether::column_type::integer}});
    auto essays = tether::builder::has_many(author, "essays");
    auto writer = tether::builder::belongs_to(essay, "writer");

    assert(essays->class_name() == "Essay");
    assert(essays->foreign_key() == "writer_id");
    assert(essays->primary_key() == "id");
    assert(writer->class_name() == "Writer");
    assert(writer->foreign_key() == "writer_id");
    assert(essays->related_type() == essay);

    // The collection finds the belongs_to that points back at it
    assert(essays->inverse_of() == writer);
    assert(writer->inverse_of() == nullptr);

    // An explicit inverseOf must name a real relationship, checked at declaration
    // when the related type already exists
    bool threw = false;
    try {
        tether::builder::has_many(author, "drafts", {{"className", "Essay"}, {"inverseOf", "nothing"}});
    } catch (const tether::configuration_error&) {
        threw = true;
    }
    assert(threw);
    assert(author->reflect_on_association("drafts") == nullptr);

    auto named = tether::builder::has_many(author, "pieces", {{"className", "Essay"}, {"inverseOf", "writer"}});
    assert(named->inverse_of() == writer);

    // A related type defined later is checked on first use
    auto pending = tether::builder::has_many(author, "notes", {{"className", "WriterNote"}, {"inverseOf", "nothing"}});
    tether::entity_type::define("WriterNote", {{"body"}, {"writer_id", tether::column_type::integer}});
    threw = false;
    try {
        pending->inverse_of();
    } catch (const tether::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Reflection defaults test passed!" << std::endl;
}

// ============================================================================
// Test: subtypes copy their parent's relationships
// ============================================================================

void test_subtype_registry() {
    std::cout << "Testing subtype registry..." << std::endl;

    auto t = define_blog("Sub");
    auto featured = tether::entity_type::define("FeaturedPostSub", {{"banner"}}, t.post);

    assert(featured->reflect_on_association("comments") != nullptr);
    assert(featured->table_name() == t.post->table_name());
    assert(featured->is_a(*t.post));
    assert(!t.post->is_a(*featured));

    tether::builder::has_many(featured, "pins", {{"className", "CommentSub"}, {"foreignKey", "post_id"}});
    assert(featured->reflect_on_association("pins") != nullptr);
    assert(t.post->reflect_on_association("pins") == nullptr);

    // Declared on the parent after the subtype exists: the subtype keeps its own map
    tether::builder::has_many(t.post, "drafts", {{"className", "CommentSub"}, {"foreignKey", "post_id"}});
    assert(t.post->reflect_on_association("drafts") != nullptr);
    assert(featured->reflect_on_association("drafts") == nullptr);

    // A subtype record resolves the inherited relationship
    tether::tether_db db;
    auto fp = db.build(featured, {{"title", text("Big")}, {"banner", text("red")}});
    fp->many("comments").build({{"name", text("x")}});
    bool saved = fp->save();
    assert(saved);
    assert(db.all(t.comment).where("post_id", id_of(fp)).count() == 1);

    std::cout << "  Subtype registry test passed!" << std::endl;
}

// ============================================================================
// Test: capability table and the association variant
// ============================================================================

void test_accessors_and_runtime_variant() {
    std::cout << "Testing accessors and runtime variant..." << std::endl;

    auto t = define_blog("Acc");
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    auto c = p->many("comments").create({{"name", text("a")}});

    auto runtime = p->association("comments");
    assert(std::holds_alternative<tether::has_many_association>(runtime));
    auto name = std::visit([](auto& a) { return a.metadata().name(); }, runtime);
    assert(name == "comments");

    auto other = c->association("post");
    assert(std::holds_alternative<tether::belongs_to_association>(other));
    assert(std::get<tether::belongs_to_association>(other).reader() == p);

    bool threw = false;
    try {
        p->association("nothing");
    } catch (const tether::configuration_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        p->one("comments");
    } catch (const tether::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Accessors and runtime variant test passed!" << std::endl;
}

// ============================================================================
// Test: reset
// ============================================================================

void test_reset() {
    std::cout << "Testing reset..." << std::endl;

    auto t = define_blog("Reset");
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    p->many("comments").create({{"name", text("a")}});
    p->many("comments").build({{"name", text("b")}});

    auto comments = p->many("comments");
    comments.load_target();
    assert(comments.loaded());
    assert(comments.target().size() == 2);

    comments.reset();
    assert(!comments.loaded());
    assert(comments.target().empty());

    // Storage is untouched
    assert(db.all(t.comment).count() == 1);
    assert(p->many("comments").size() == 1);

    std::cout << "  Reset test passed!" << std::endl;
}

// ============================================================================
// Test: built records survive a load
// ============================================================================

void test_built_records_survive_load() {
    std::cout << "Testing built records survive load..." << std::endl;

    auto t = define_blog("Survive");
    tether::tether_db db;

    // Fetch returns two rows
    auto p = saved_post(db, t, "Hello");
    for (const char* n : {"a", "b"}) {
        auto c = db.build(t.comment, {{"name", text(n)}, {"post_id", id_of(p)}});
        db.save_or_throw(*c);
    }
    auto fresh = db.find(t.post, id_of(p));
    auto built = fresh->many("comments").build({{"name", text("new")}});
    assert(!fresh->many("comments").loaded());

    const auto& target = fresh->many("comments").load_target();
    assert(target.size() == 3);
    assert(std::count(target.begin(), target.end(), built) == 1);
    assert(name_of(target[0]) == "a");
    assert(name_of(target[1]) == "b");
    assert(target[2] == built);

    // Fetch returns nothing
    auto empty = saved_post(db, t, "Empty");
    auto lone = empty->many("comments").build({{"name", text("lone")}});
    const auto& only = empty->many("comments").load_target();
    assert(only.size() == 1);
    assert(only[0] == lone);

    std::cout << "  Built records survive load test passed!" << std::endl;
}

// ============================================================================
// Test: a fetched row keeps the held instance
// ============================================================================

void test_merge_keeps_held_instance() {
    std::cout << "Testing merge keeps held instances..." << std::endl;

    auto t = define_blog("Merge");
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");

    auto a = p->many("comments").create({{"name", text("a")}});
    auto b = p->many("comments").create({{"name", text("b")}});
    assert(!p->many("comments").loaded());

    // Changed behind our back; b also has an unsaved local edit
    db.all(t.comment).update_all({{"name", text("changed")}});
    b->set("name", text("local"));

    const auto& target = p->many("comments").load_target();
    assert(target.size() == 2);
    assert(target[0] == a);
    assert(target[1] == b);
    assert(name_of(a) == "changed");
    assert(name_of(b) == "local");

    // The fetched members point back at the owner instance
    auto inverse = a->one("post");
    assert(inverse == p);

    std::cout << "  Merge keeps held instances test passed!" << std::endl;
}

// ============================================================================
// Test: empty / any agree in every state
// ============================================================================

void test_empty_and_any_agree() {
    std::cout << "Testing empty and any..." << std::endl;

    auto t = define_blog("Empty");
    tether::tether_db db;

    auto check = [](tether::collection_proxy proxy, bool expect_empty) {
        bool e = proxy.empty();
        bool a = proxy.any();
        assert(e == expect_empty);
        assert(a == !e);
    };

    // Unsaved owner, nothing built
    auto p = db.build(t.post, {{"title", text("Draft")}});
    check(p->many("comments"), true);

    // Unsaved owner with a built member
    p->many("comments").build({{"name", text("a")}});
    check(p->many("comments"), false);

    // Persisted, not loaded, rows in storage
    bool saved = p->save();
    assert(saved);
    auto fresh = db.find(t.post, id_of(p));
    check(fresh->many("comments"), false);
    assert(!fresh->many("comments").loaded());

    // Loaded
    fresh->many("comments").load_target();
    check(fresh->many("comments"), false);

    // Reset, then persisted owner without rows
    fresh->many("comments").reset();
    check(fresh->many("comments"), false);
    auto bare = saved_post(db, t, "Bare");
    check(bare->many("comments"), true);
    bare->many("comments").load_target();
    check(bare->many("comments"), true);

    // Predicate forms load
    auto comments = fresh->many("comments");
    assert(comments.any([](const tether::record_ptr& r) { return name_of(r) == "a"; }));
    assert(!comments.many([](const tether::record_ptr& r) { return name_of(r) == "a"; }));
    assert(comments.loaded());

    std::cout << "  Empty and any test passed!" << std::endl;
}

// ============================================================================
// Test: size and many without a full load
// ============================================================================

void test_size_and_many() {
    std::cout << "Testing size and many..." << std::endl;

    auto t = define_blog("Size");
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    p->many("comments").create({{"name", text("a")}});
    p->many("comments").create({{"name", text("b")}});

    auto fresh = db.find(t.post, id_of(p));
    auto comments = fresh->many("comments");
    assert(comments.size() == 2);
    assert(comments.many());

    comments.build({{"name", text("c")}});
    assert(comments.size() == 3);
    assert(!comments.loaded());

    comments.load_target();
    assert(comments.size() == 3);

    std::cout << "  Size and many test passed!" << std::endl;
}

// ============================================================================
// Test: include
// ============================================================================

void test_include() {
    std::cout << "Testing include..." << std::endl;

    auto t = define_blog("Incl");
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    auto other = saved_post(db, t, "Other");
    auto mine = p->many("comments").create({{"name", text("mine")}});
    auto theirs = other->many("comments").create({{"name", text("theirs")}});

    auto fresh = db.find(t.post, id_of(p));

    // Wrong type: false without any statement
    sqlite3_trace_v2(db.db().handle(), SQLITE_TRACE_STMT, count_statements, nullptr);
    g_statements = 0;
    assert(!fresh->many("comments").include(other));
    assert(g_statements == 0);

    // Persisted candidate, not loaded: existence check by id
    assert(fresh->many("comments").include(mine));
    assert(!fresh->many("comments").include(theirs));
    assert(g_statements > 0);
    assert(!fresh->many("comments").loaded());
    sqlite3_trace_v2(db.db().handle(), 0, nullptr, nullptr);

    // Unsaved candidate: identity in the target
    auto built = fresh->many("comments").build({{"name", text("new")}});
    auto stranger = db.build(t.comment, {{"name", text("new")}});
    assert(fresh->many("comments").include(built));
    assert(!fresh->many("comments").include(stranger));

    // Loaded: membership in the target
    fresh->many("comments").load_target();
    assert(fresh->many("comments").include(mine));
    assert(!fresh->many("comments").include(theirs));

    std::cout << "  Include test passed!" << std::endl;
}

// ============================================================================
// Test: ids reader / writer
// ============================================================================

void test_ids_writer_keeps_order() {
    std::cout << "Testing ids writer..." << std::endl;

    auto t = define_blog("Ids");
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");

    std::vector<tether::record_ptr> loose;
    for (const char* n : {"c1", "c2", "c3", "c4"}) {
        auto c = db.build(t.comment, {{"name", text(n)}});
        db.save_or_throw(*c);
        loose.push_back(c);
    }
    auto c1 = id_of(loose[0]);
    auto c2 = id_of(loose[1]);
    auto c3 = id_of(loose[2]);

    // Blank and malformed entries are dropped, duplicates keep their first position
    p->many("comments").set_ids({c3, text(""), c1, nullptr, text("   "), c3, text("x"), text(std::to_string(c2))});

    auto ids = p->many("comments").ids();
    assert(ids.size() == 3);
    assert(ids[0] == tether::column_value_t{c3});
    assert(ids[1] == tether::column_value_t{c1});
    assert(ids[2] == tether::column_value_t{c2});

    // Storage agrees on membership; unloaded ids come from a projection
    auto fresh = db.find(t.post, id_of(p));
    auto stored = fresh->many("comments").ids();
    assert(stored.size() == 3);
    assert(!fresh->many("comments").loaded());
    assert(db.all(t.comment).where("post_id", nullptr).count() == 1);

    // Non-finite and out of range numbers are dropped like blanks
    p->many("comments").set_ids({tether::column_value_t{std::nan("")}, tether::column_value_t{1e300},
                                 tether::column_value_t{-HUGE_VAL}, c1});
    ids = p->many("comments").ids();
    assert(ids.size() == 1);
    assert(ids[0] == tether::column_value_t{c1});

    // A missing id fails like find
    bool threw = false;
    try {
        p->many("comments").set_ids({c1, tether::primary_key_t{9999}});
    } catch (const tether::record_not_found_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Ids writer test passed!" << std::endl;
}

// ============================================================================
// Test: select
// ============================================================================

void test_select() {
    std::cout << "Testing select..." << std::endl;

    auto t = define_blog("Select");
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    p->many("comments").create({{"name", text("apple")}});
    p->many("comments").create({{"name", text("banana")}});

    auto fresh = db.find(t.post, id_of(p));
    auto rows = fresh->many("comments").select(std::vector<std::string>{"name"});
    assert(rows.size() == 2);
    assert(rows[0].size() == 1);
    assert(std::get<std::string>(rows[0].at("name")) == "apple");
    assert(!fresh->many("comments").loaded());

    auto matches = fresh->many("comments").select([](const tether::record_ptr& r) {
        return name_of(r).front() == 'b';
    });
    assert(matches.size() == 1);
    assert(name_of(matches[0]) == "banana");
    assert(fresh->many("comments").loaded());

    std::cout << "  Select test passed!" << std::endl;
}

// ============================================================================
// Scenario: build on an unsaved owner, save, then create
// ============================================================================

void test_unsaved_owner_scenario() {
    std::cout << "Testing unsaved owner scenario..." << std::endl;

    auto t = define_blog("Scenario");
    tether::tether_db db;

    auto p = db.build(t.post, {{"title", text("Draft")}});
    auto a = p->many("comments").build({{"name", text("a")}});
    assert(a->is_new_record());
    assert(!p->many("comments").empty());
    assert(p->many("comments").size() == 1);
    assert(a->one("post") == p);

    // create needs a saved owner
    bool threw = false;
    try {
        p->many("comments").create({{"name", text("b")}});
    } catch (const tether::record_not_saved_error&) {
        threw = true;
    }
    assert(threw);
    assert(p->many("comments").size() == 1);

    bool saved = p->save();
    assert(saved);
    assert(a->is_persisted());
    assert(a->get("post_id") == p->get("id"));

    auto b = p->many("comments").create({{"name", text("b")}});
    assert(b->is_persisted());

    std::vector<std::string> names;
    for (const auto& c : p->many("comments")) {
        assert(c->is_persisted());
        names.push_back(name_of(c));
    }
    assert((names == std::vector<std::string>{"a", "b"}));

    // Storage agrees
    auto fresh = db.find(t.post, id_of(p));
    assert(fresh->many("comments").size() == 2);

    std::cout << "  Unsaved owner scenario test passed!" << std::endl;
}

// ============================================================================
// Test: create needs a persisted owner
// ============================================================================

void test_create_on_destroyed_owner() {
    std::cout << "Testing create on a destroyed owner..." << std::endl;

    auto t = define_blog("Gone");
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    bool destroyed = db.destroy(*p);
    assert(destroyed);
    assert(!p->is_new_record());
    assert(!p->is_persisted());

    bool threw = false;
    try {
        p->many("comments").create({{"name", text("orphan")}});
    } catch (const tether::record_not_saved_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        p->many("comments").create_or_throw({{"name", text("orphan")}});
    } catch (const tether::record_not_saved_error&) {
        threw = true;
    }
    assert(threw);

    assert(db.all(t.comment).count() == 0);
    assert(p->many("comments").target().empty());

    std::cout << "  Create on destroyed owner test passed!" << std::endl;
}

// ============================================================================
// Test: create / create_or_throw
// ============================================================================

void test_create_validation() {
    std::cout << "Testing create validation..." << std::endl;

    auto t = define_blog("Create");
    t.comment->validates(require_name);
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");

    // create keeps the invalid record with its errors
    auto bad = p->many("comments").create(tether::attributes_t{});
    assert(bad->is_new_record());
    assert(bad->errors().on("name").size() == 1);
    assert(p->many("comments").target().size() == 1);

    // create_or_throw raises and rolls back
    bool threw = false;
    try {
        p->many("comments").create_or_throw({{"name", text("")}});
    } catch (const tether::record_invalid_error& e) {
        threw = true;
        assert(e.messages().size() == 1);
        assert(e.messages()[0] == "name can't be blank");
    }
    assert(threw);
    assert(db.all(t.comment).count() == 0);
    assert(p->many("comments").target().size() == 1);

    // List form matches the input shape
    auto made = p->many("comments").create_or_throw(std::vector<tether::attributes_t>{
        {{"name", text("x")}}, {{"name", text("y")}}});
    assert(made.size() == 2);
    assert(made[0]->is_persisted() && made[1]->is_persisted());
    assert(db.all(t.comment).count() == 2);

    std::cout << "  Create validation test passed!" << std::endl;
}

// ============================================================================
// Test: concat
// ============================================================================

void test_concat() {
    std::cout << "Testing concat..." << std::endl;

    auto t = define_blog("Concat");
    t.comment->validates(require_name);
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");

    // Persisted owner: inserted in one transaction, nested lists flattened
    auto a = db.build(t.comment, {{"name", text("a")}});
    auto b = db.build(t.comment, {{"name", text("b")}});
    auto c = db.build(t.comment, {{"name", text("c")}});
    bool ok = p->many("comments").concat(a, std::vector<tether::record_ptr>{b, c});
    assert(ok);
    assert(a->is_persisted() && b->is_persisted() && c->is_persisted());
    assert(db.all(t.comment).where("post_id", id_of(p)).count() == 3);

    // Wrong type
    bool threw = false;
    try {
        p->many("comments").concat(saved_post(db, t, "Nope"));
    } catch (const tether::type_mismatch_error&) {
        threw = true;
    }
    assert(threw);

    // One invalid record: false, and the call's inserts are rolled back
    auto good = db.build(t.comment, {{"name", text("good")}});
    auto bad = db.build(t.comment, {});
    ok = p->many("comments").concat(good, bad);
    assert(!ok);
    assert(good->is_new_record());
    assert(!good->id().has_value());
    assert(bad->errors().on("name").size() == 1);
    assert(db.all(t.comment).count() == 3);

    // Unsaved owner: held in memory only, saved with the owner
    auto draft = db.build(t.post, {{"title", text("Draft")}});
    auto d = db.build(t.comment, {{"name", text("d")}});
    ok = draft->many("comments").concat(d);
    assert(ok);
    assert(d->is_new_record());
    assert(draft->many("comments").loaded());
    assert(draft->many("comments").size() == 1);

    bool saved = draft->save();
    assert(saved);
    assert(d->is_persisted());
    assert(d->get("post_id") == draft->get("id"));

    std::cout << "  Concat test passed!" << std::endl;
}

// ============================================================================
// Test: replace through the writer
// ============================================================================

void test_replace() {
    std::cout << "Testing replace..." << std::endl;

    auto t = define_blog("Replace");
    t.comment->validates(require_name);
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    auto c1 = p->many("comments").create({{"name", text("c1")}});
    auto c2 = p->many("comments").create({{"name", text("c2")}});
    auto c3 = db.build(t.comment, {{"name", text("c3")}});

    p->assign_many("comments", {c3, c2});

    const auto& target = p->many("comments").target();
    assert(target.size() == 2);
    assert(target[0] == c3);
    assert(target[1] == c2);
    assert(c3->is_persisted());

    // Default removal nullifies the foreign key
    auto detached = db.find(t.comment, id_of(c1));
    assert(tether::detail::is_null(detached->get("post_id")));
    assert(tether::detail::is_null(c1->get("post_id")));
    assert(db.all(t.comment).where("post_id", id_of(p)).count() == 2);

    // A member that cannot be saved restores the target
    auto bad = db.build(t.comment, {});
    bool threw = false;
    try {
        p->many("comments").replace({c2, bad});
    } catch (const tether::record_not_saved_error&) {
        threw = true;
    }
    assert(threw);
    assert(p->many("comments").target().size() == 2);
    assert(bad->is_new_record());
    assert(db.all(t.comment).where("post_id", id_of(p)).count() == 2);

    // Wrong type is rejected before anything changes
    threw = false;
    try {
        p->many("comments").replace({saved_post(db, t, "Nope")});
    } catch (const tether::type_mismatch_error&) {
        threw = true;
    }
    assert(threw);
    assert(p->many("comments").target().size() == 2);

    std::cout << "  Replace test passed!" << std::endl;
}

void test_replace_removal_policies() {
    std::cout << "Testing replace removal policies..." << std::endl;

    tether::tether_db db;

    auto destroying = define_blog("RepDestroy", {{"dependent", "destroy"}});
    auto p = saved_post(db, destroying, "Hello");
    auto c1 = p->many("comments").create({{"name", text("c1")}});
    p->assign_many("comments", {});
    assert(c1->is_destroyed());
    assert(db.all(destroying.comment).count() == 0);

    auto deleting = define_blog("RepDelete", {{"dependent", "delete_all"}});
    auto q = saved_post(db, deleting, "Hello");
    auto d1 = q->many("comments").create({{"name", text("d1")}});
    auto d2 = q->many("comments").create({{"name", text("d2")}});
    q->many("comments").delete_records({d1});
    assert(db.all(deleting.comment).count() == 1);
    assert(q->many("comments").load_target().size() == 1);
    assert(q->many("comments").load_target()[0] == d2);

    q->many("comments").destroy_records({d2});
    assert(d2->is_destroyed());
    assert(db.all(deleting.comment).count() == 0);

    // A null member is a type mismatch, not a crash
    for (bool destroying_call : {false, true}) {
        bool threw = false;
        try {
            if (destroying_call) {
                q->many("comments").destroy_records(std::vector<tether::record_ptr>{nullptr});
            } else {
                q->many("comments").delete_records(std::vector<tether::record_ptr>{nullptr});
            }
        } catch (const tether::type_mismatch_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "  Replace removal policies test passed!" << std::endl;
}

// ============================================================================
// Scenario: cascades
// ============================================================================

void test_restrict_with_exception() {
    std::cout << "Testing restrict_with_exception..." << std::endl;

    auto t = define_blog("Restrict", {{"dependent", "restrict_with_exception"}});
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    p->many("comments").create({{"name", text("only")}});

    auto fresh = db.find(t.post, id_of(p));
    bool threw = false;
    try {
        fresh->destroy();
    } catch (const tether::delete_restriction_error& e) {
        threw = true;
        assert(e.association_name() == "comments");
    }
    assert(threw);
    assert(fresh->is_persisted());
    assert(db.all(t.post).count() == 1);
    assert(db.all(t.comment).count() == 1);

    // Nothing left to restrict
    auto empty = saved_post(db, t, "Empty");
    bool destroyed = empty->destroy();
    assert(destroyed);
    assert(empty->is_destroyed());

    std::cout << "  restrict_with_exception test passed!" << std::endl;
}

void test_restrict_with_error() {
    std::cout << "Testing restrict_with_error..." << std::endl;

    auto t = define_blog("RestrictErr", {{"dependent", "restrict_with_error"}});
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    p->many("comments").create({{"name", text("only")}});

    bool destroyed = p->destroy();
    assert(!destroyed);
    assert(p->is_persisted());
    auto messages = p->errors().full_messages();
    assert(messages.size() == 1);
    assert(messages[0] == "Cannot delete record because dependent comments exist");
    assert(db.all(t.post).count() == 1);

    std::cout << "  restrict_with_error test passed!" << std::endl;
}

void test_destroy_cascade() {
    std::cout << "Testing destroy cascade..." << std::endl;

    auto t = define_blog("Cascade", {{"dependent", "destroy"}});
    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    p->many("comments").create({{"name", text("a")}});
    p->many("comments").create({{"name", text("b")}});

    auto fresh = db.find(t.post, id_of(p));
    std::vector<tether::record_ptr> members = fresh->many("comments").load_target();
    assert(members.size() == 2);

    bool destroyed = fresh->destroy();
    assert(destroyed);
    assert(fresh->is_destroyed());
    for (const auto& m : members) {
        assert(m->is_destroyed());
        assert(m->destroyed_by_association() == t.post->reflect_on_association("comments").get());
    }
    assert(db.all(t.comment).count() == 0);
    assert(db.all(t.post).count() == 0);

    std::cout << "  Destroy cascade test passed!" << std::endl;
}

void test_bulk_cascades() {
    std::cout << "Testing delete_all and nullify cascades..." << std::endl;

    tether::tether_db db;

    auto deleting = define_blog("BulkDelete", {{"dependent", "delete_all"}});
    auto p = saved_post(db, deleting, "Hello");
    p->many("comments").create({{"name", text("a")}});
    p->many("comments").create({{"name", text("b")}});
    bool destroyed = p->destroy();
    assert(destroyed);
    assert(db.all(deleting.comment).count() == 0);

    auto nullifying = define_blog("BulkNullify", {{"dependent", "nullify"}});
    auto q = saved_post(db, nullifying, "Hello");
    q->many("comments").create({{"name", text("a")}});
    destroyed = q->destroy();
    assert(destroyed);
    assert(db.all(nullifying.comment).count() == 1);
    assert(db.all(nullifying.comment).where("post_id", nullptr).count() == 1);

    // Explicit delete_all without a dependent option nullifies
    auto plain = define_blog("BulkPlain");
    auto r = saved_post(db, plain, "Hello");
    r->many("comments").create({{"name", text("a")}});
    r->many("comments").create({{"name", text("b")}});
    size_t affected = r->many("comments").delete_all();
    assert(affected == 2);
    assert(r->many("comments").loaded());
    assert(r->many("comments").empty());
    assert(db.all(plain.comment).count() == 2);

    std::cout << "  Bulk cascades test passed!" << std::endl;
}

// ============================================================================
// Test: belongs_to
// ============================================================================

void test_belongs_to() {
    std::cout << "Testing belongs_to..." << std::endl;

    auto t = define_blog("Belongs");
    tether::tether_db db;

    // Unsaved target is saved first
    auto c = db.build(t.comment, {{"name", text("a")}});
    auto p = db.build(t.post, {{"title", text("Hello")}});
    c->assign_one("post", p);
    assert(tether::detail::is_null(c->get("post_id")));
    bool saved = c->save();
    assert(saved);
    assert(p->is_persisted());
    assert(c->get("post_id") == p->get("id"));
    assert(c->one("post") == p);

    // Read back through a query
    auto fresh = db.find(t.comment, id_of(c));
    auto loaded = fresh->one("post");
    assert(loaded != nullptr);
    assert(loaded->same_entity(*p));

    // Changing the key makes the cached target stale
    auto other = saved_post(db, t, "Other");
    fresh->set("post_id", id_of(other));
    auto reloaded = fresh->one("post");
    assert(reloaded->same_entity(*other));

    // Clearing
    fresh->assign_one("post", nullptr);
    assert(fresh->one("post") == nullptr);
    assert(tether::detail::is_null(fresh->get("post_id")));

    // Wrong type
    bool threw = false;
    try {
        fresh->assign_one("post", c);
    } catch (const tether::type_mismatch_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  belongs_to test passed!" << std::endl;
}

// ============================================================================
// Test: changing the owner key forces a reload
// ============================================================================

void test_collection_staleness() {
    std::cout << "Testing collection staleness..." << std::endl;

    auto author = tether::entity_type::define("AuthorStale", {{"code"}});
    auto book = tether::entity_type::define("BookStale", {{"name"}, {"author_code"}});
    tether::builder::has_many(author, "books", {{"className", "BookStale"},
                                                {"foreignKey", "author_code"},
                                                {"primaryKey", "code"}});

    tether::tether_db db;
    auto a = db.build(author, {{"code", text("A")}});
    db.save_or_throw(*a);
    auto first = a->many("books").create({{"name", text("first")}});
    assert(first->get("author_code") == text("A"));
    auto second = db.build(book, {{"name", text("second")}, {"author_code", text("B")}});
    db.save_or_throw(*second);

    auto books = a->many("books").load_target();
    assert(books.size() == 1);
    assert(name_of(books[0]) == "first");

    a->set("code", text("B"));
    auto after = a->many("books");
    assert(after.loaded());
    assert(after.target().size() == 1);
    assert(name_of(after.target()[0]) == "second");

    // Forced reload
    db.all(book).update_all({{"author_code", text("B")}});
    assert(a->many("books", true).target().size() == 2);

    std::cout << "  Collection staleness test passed!" << std::endl;
}

// ============================================================================
// Test: transactions
// ============================================================================

void test_nested_transactions() {
    std::cout << "Testing nested transactions..." << std::endl;

    auto t = define_blog("Tx");
    tether::tether_db db;
    auto outer = db.build(t.post, {{"title", text("outer")}});
    auto inner = db.build(t.post, {{"title", text("inner")}});

    bool committed = db.run_in_transaction([&] {
        bool saved = outer->save();
        assert(saved);

        bool kept = db.run_in_transaction([&] {
            bool inner_saved = inner->save();
            assert(inner_saved);
            assert(inner->is_persisted());
            return false;
        });
        assert(!kept);
        assert(inner->is_new_record());
        assert(!inner->id().has_value());
        assert(outer->is_persisted());
        return true;
    });
    assert(committed);
    assert(db.all(t.post).count() == 1);
    assert(outer->is_persisted());

    // An exception rolls back and propagates
    auto doomed = db.build(t.post, {{"title", text("doomed")}});
    bool threw = false;
    try {
        db.run_in_transaction([&] {
            bool saved = doomed->save();
            assert(saved);
            throw std::runtime_error("Simulated error");
            return true;
        });
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(doomed->is_new_record());
    assert(db.all(t.post).count() == 1);

    // A rolled back destroy comes back
    bool destroyed = false;
    db.run_in_transaction([&] {
        destroyed = outer->destroy();
        return false;
    });
    assert(destroyed);
    assert(!outer->is_destroyed());
    assert(db.all(t.post).count() == 1);

    std::cout << "  Nested transactions test passed!" << std::endl;
}

// ============================================================================
// Test: single-table subtypes
// ============================================================================

void test_subtype_hydration() {
    std::cout << "Testing subtype hydration..." << std::endl;

    auto vehicle = tether::entity_type::define("VehicleHyd", {{"name"}});
    auto truck = tether::entity_type::define("TruckHyd", {{"payload", tether::column_type::integer}}, vehicle);

    tether::tether_db db;
    auto v = db.build(vehicle, {{"name", text("bike")}});
    db.save_or_throw(*v);
    auto tr = db.build(truck, {{"name", text("hauler")}, {"payload", int64_t{900}}});
    db.save_or_throw(*tr);

    auto all = db.all(vehicle).to_list();
    assert(all.size() == 2);
    assert(&all[0]->type() == vehicle.get());
    assert(&all[1]->type() == truck.get());
    assert(all[1]->get("payload") == tether::column_value_t{int64_t{900}});

    assert(db.all(truck).count() == 1);
    assert(db.all(vehicle).count() == 2);

    // find through the subtype only sees subtype rows
    bool threw = false;
    try {
        db.find(truck, id_of(v));
    } catch (const tether::record_not_found_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Subtype hydration test passed!" << std::endl;
}

// ============================================================================
// Test: serialization
// ============================================================================

void test_serializer() {
    std::cout << "Testing serializer..." << std::endl;

    auto t = define_blog("Ser", {{"only", {"name"}}});
    tether::builder::has_many(t.post, "tags", {{"virtualValue", {"fixed"}}});
    tether::builder::has_many(t.post, "comment_ids", {{"className", "CommentSer"},
                                                     {"foreignKey", "post_id"},
                                                     {"embed", "ids"}});
    tether::builder::has_many(t.post, "summaries", {{"className", "CommentSer"},
                                                   {"foreignKey", "post_id"},
                                                   {"eachSerializer", "comment_summary"}});
    tether::serializer_registry::instance().register_record_serializer("comment_summary", [](tether::record& r) {
        return nlohmann::json("#" + std::get<std::string>(r.get("name")));
    });

    tether::tether_db db;
    auto p = saved_post(db, t, "Hello");
    auto a = p->many("comments").create({{"name", text("a")}});
    auto b = p->many("comments").create({{"name", text("b")}});

    auto out = tether::serializer::serialize(*p);
    assert(out["id"] == id_of(p));
    assert(out["title"] == "Hello");
    assert(out["comments"].size() == 2);
    assert(out["comments"][0]["name"] == "a");
    assert(!out["comments"][0].contains("id"));
    assert(!out["comments"][0].contains("post"));
    assert(out["tags"] == nlohmann::json::array({"fixed"}));
    assert(out["comment_ids"] == nlohmann::json::array({id_of(a), id_of(b)}));
    assert(out["summaries"] == nlohmann::json::array({"#a", "#b"}));

    // only / except at the top level
    tether::serialize_options options;
    options.except = {"title", "tags"};
    auto trimmed = tether::serializer::serialize(*p, options);
    assert(!trimmed.contains("title"));
    assert(!trimmed.contains("tags"));
    assert(trimmed.contains("comments"));

    // only drops relationships it does not list
    tether::serialize_options narrow;
    narrow.only = {"id", "title"};
    auto narrowed = tether::serializer::serialize(*p, narrow);
    assert(narrowed.size() == 2);
    assert(narrowed["title"] == "Hello");
    assert(!narrowed.contains("comments"));
    assert(!narrowed.contains("tags"));

    narrow.only = {"comment_ids"};
    narrowed = tether::serializer::serialize(*p, narrow);
    assert(narrowed.size() == 1);
    assert(narrowed["comment_ids"] == nlohmann::json::array({id_of(a), id_of(b)}));

    // to-one nests the target without its relationships
    auto comment_out = tether::serializer::serialize(*a);
    assert(comment_out["post"]["title"] == "Hello");
    assert(!comment_out["post"].contains("comments"));

    // Unknown serializer names fail when used
    auto broken = tether::entity_type::define("BrokenSer", {{"title"}});
    tether::builder::has_many(broken, "comments", {{"className", "CommentSer"},
                                                  {"foreignKey", "post_id"},
                                                  {"serializer", "missing"}});
    auto bp = db.build(broken, {{"title", text("x")}});
    db.save_or_throw(*bp);
    bool threw = false;
    try {
        tether::serializer::serialize(*bp);
    } catch (const tether::configuration_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Serializer test passed!" << std::endl;
}

void test_existing_reader_preserved() {
    std::cout << "Testing existing reader is preserved..." << std::endl;

    auto t = tether::entity_type::define("PostReader", {{"title"}});
    tether::entity_type::define("CommentReader", {{"name"}, {"post_reader_id", tether::column_type::integer}});
    t->define_reader("comments", [](tether::record&) { return nlohmann::json("custom"); });
    tether::builder::has_many(t, "comments", {{"className", "CommentReader"}});

    tether::tether_db db;
    auto p = db.build(t, {{"title", text("Hello")}});
    db.save_or_throw(*p);
    p->many("comments").create({{"name", text("a")}});

    auto out = tether::serializer::serialize(*p);
    assert(out["comments"] == "custom");
    // The relationship itself still works through the capability table
    assert(p->many("comments").size() == 1);

    std::cout << "  Existing reader test passed!" << std::endl;
}

// ============================================================================
// Test: configuration
// ============================================================================

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    auto config = tether::configuration::from_json({{"path", ":memory:"}, {"logLevel", "warn"}});
    assert(config.path == ":memory:");
    assert(config.level == tether::log_level::warn);

    {
        tether::tether_db db(config);
        assert(tether::get_log_level() == tether::log_level::warn);
    }
    tether::set_log_level(tether::log_level::off);

    bool threw = false;
    try {
        tether::configuration::from_json({{"logLevel", "loud"}});
    } catch (const tether::tether_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  Configuration test passed!" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== TetherCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Declarations
        test_load_state_transitions();
        test_builder_rejects_bad_declarations();
        test_reflection_defaults();
        test_subtype_registry();
        test_accessors_and_runtime_variant();

        // Loading
        test_reset();
        test_built_records_survive_load();
        test_merge_keeps_held_instance();
        test_empty_and_any_agree();
        test_size_and_many();
        test_include();
        test_ids_writer_keeps_order();
        test_select();

        // Mutations
        test_unsaved_owner_scenario();
        test_create_on_destroyed_owner();
        test_create_validation();
        test_concat();
        test_replace();
        test_replace_removal_policies();

        // Cascades
        test_restrict_with_exception();
        test_restrict_with_error();
        test_destroy_cascade();
        test_bulk_cascades();

        // Singular side and staleness
        test_belongs_to();
        test_collection_staleness();

        // Store
        test_nested_transactions();
        test_subtype_hydration();
        test_configuration();

        // Serialization
        test_serializer();
        test_existing_reader_preserved();

        std::cout << std::endl;
        std::cout << "=== All tests passed! ===" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
