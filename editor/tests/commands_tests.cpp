// Slide commands against the in-memory repository.
#include "commands/create_slide.hpp"
#include "commands/delete_slide.hpp"
#include "commands/move_slide.hpp"
#include "commands/update_slide.hpp"
#include "folio/command.hpp"
#include "folio/errors.hpp"
#include "folio/repository.hpp"
#include <cassert>
#include <memory>
#include <string>
#include <vector>

using namespace folio;

namespace {

template <typename E, typename Fn>
void expectThrow(Fn&& fn) {
    bool threw = false;
    try {
        fn();
    } catch (const E&) {
        threw = true;
    }
    assert(threw);
}

// Executes a CreateSlide through the history and returns the new id.
std::string create(CommandHistory& h, ISlideRepository& repo, const std::string& doc, FieldMap fields,
                   std::optional<int> order = std::nullopt) {
    auto cmd = std::make_unique<CreateSlideCommand>(doc, std::move(fields), order);
    auto* raw = cmd.get();
    h.execute(std::move(cmd), repo);
    return raw->createdSlideId();
}

std::vector<std::string> orderOf(const ISlideRepository& repo, const std::string& doc) {
    std::vector<std::string> out;
    for (const auto& s : repo.listByDocument(doc)) out.push_back(s.title + "@" + std::to_string(s.order_index));
    return out;
}

void test_create_update_undo_redo_scenario() {
    InMemorySlideRepository repo;
    CommandHistory h;
    const std::string s1 = create(h, repo, "deck", {{"title", "S1"}});
    assert(!s1.empty());
    assert(repo.getById(s1)->title == "S1");

    h.execute(std::make_unique<UpdateSlideCommand>(s1, FieldMap{{"title", "A"}}), repo);
    assert(repo.getById(s1)->title == "A");

    h.undo(repo);
    assert(repo.getById(s1)->title == "S1");
    h.undo(repo);
    assert(!repo.getById(s1).has_value());

    h.redo(repo);
    assert(repo.getById(s1).has_value());
    assert(repo.getById(s1)->title == "S1");
    h.redo(repo);
    assert(repo.getById(s1)->title == "A");
}

void test_create_order_defaults_to_end() {
    InMemorySlideRepository repo;
    CommandHistory h;
    create(h, repo, "deck", {{"title", "one"}});
    create(h, repo, "deck", {{"title", "two"}});
    create(h, repo, "deck", {{"title", "pinned"}}, 7);
    create(h, repo, "other", {{"title", "elsewhere"}});
    assert((orderOf(repo, "deck") == std::vector<std::string>{"one@0", "two@1", "pinned@7"}));
    assert((orderOf(repo, "other") == std::vector<std::string>{"elsewhere@0"}));
}

void test_update_snapshots_only_changed_fields() {
    InMemorySlideRepository repo;
    CommandHistory h;
    const std::string id = create(h, repo, "deck", {{"title", "Old"}, {"notes", "keep"}});

    auto cmd = std::make_unique<UpdateSlideCommand>(id, FieldMap{{"title", "New"}, {"subtitle", "Sub"}});
    auto* update = cmd.get();
    h.execute(std::move(cmd), repo);
    const FieldMap expected = {{"title", "Old"}, {"subtitle", nullptr}};
    assert(update->previousValues().has_value());
    assert(*update->previousValues() == expected);

    // A field the update never touched changes behind the history's back.
    Slide external = *repo.getById(id);
    external.notes = "edited elsewhere";
    repo.update(external);

    h.undo(repo);
    Slide after = *repo.getById(id);
    assert(after.title == "Old");
    assert(!after.subtitle.has_value());
    assert(after.notes == std::optional<std::string>("edited elsewhere"));
}

void test_content_update_bumps_and_restores_version() {
    InMemorySlideRepository repo;
    CommandHistory h;
    const std::string id = create(h, repo, "deck", {{"title", "Chart"}, {"content", {{"body", "v1"}}}});
    assert(repo.getById(id)->version == 1);

    h.execute(std::make_unique<UpdateSlideCommand>(id, FieldMap{{"content", {{"body", "v2"}}}}), repo);
    assert(repo.getById(id)->version == 2);
    assert(repo.getById(id)->content["body"] == "v2");

    h.undo(repo);
    assert(repo.getById(id)->version == 1);
    assert(repo.getById(id)->content["body"] == "v1");
}

void test_update_failures() {
    InMemorySlideRepository repo;
    CommandHistory h;
    const std::string id = create(h, repo, "deck", {{"title", "T"}});

    expectThrow<ExecutionError>([&] {
        h.execute(std::make_unique<UpdateSlideCommand>(id, FieldMap{{"title", "X"}, {"colour", "red"}}), repo);
    });
    expectThrow<ExecutionError>([&] {
        h.execute(std::make_unique<UpdateSlideCommand>(id, FieldMap{{"layout_type", "spiral"}}), repo);
    });
    expectThrow<ExecutionError>([&] {
        h.execute(std::make_unique<UpdateSlideCommand>("missing", FieldMap{{"title", "X"}}), repo);
    });
    assert(repo.getById(id)->title == "T");
    assert(h.size() == 1);

    expectThrow<std::invalid_argument>([&] { UpdateSlideCommand bad(id, json::array()); });
}

void test_undo_fails_when_slide_vanished() {
    InMemorySlideRepository repo;
    CommandHistory h;
    const std::string id = create(h, repo, "deck", {{"title", "T"}});
    h.execute(std::make_unique<UpdateSlideCommand>(id, FieldMap{{"title", "U"}}), repo);

    repo.remove(id);
    expectThrow<UndoError>([&] { h.undo(repo); });
    assert(h.currentIndex() == 1);
}

void test_delete_recreates_snapshot() {
    InMemorySlideRepository repo;
    CommandHistory h;
    create(h, repo, "deck", {{"title", "first"}});
    const std::string id = create(h, repo, "deck",
                                  {{"title", "Doomed"}, {"notes", "n"}, {"font_family", "Inter"},
                                   {"layout_type", "comparison"}, {"content", {{"rows", 3}}}});
    h.execute(std::make_unique<UpdateSlideCommand>(id, FieldMap{{"content", {{"rows", 4}}}}), repo);
    const Slide before = *repo.getById(id);

    auto cmd = std::make_unique<DeleteSlideCommand>(id);
    auto* del = cmd.get();
    h.execute(std::move(cmd), repo);
    assert(!repo.getById(id).has_value());
    assert(del->deletedSlide().has_value() && *del->deletedSlide() == before);

    h.undo(repo);
    auto restored = repo.getById(id);
    assert(restored.has_value());
    assert(*restored == before);
    assert(restored->order_index == 1);
    assert(restored->version == 2);

    h.redo(repo);
    assert(!repo.getById(id).has_value());

    expectThrow<ExecutionError>([&] { h.execute(std::make_unique<DeleteSlideCommand>("nope"), repo); });
}

void test_move_undo_restores_only_moved_slide() {
    InMemorySlideRepository repo;
    CommandHistory h;
    const std::string a = create(h, repo, "deck", {{"title", "A"}});
    const std::string b = create(h, repo, "deck", {{"title", "B"}});
    const std::string c = create(h, repo, "deck", {{"title", "C"}});

    auto cmd = std::make_unique<MoveSlideCommand>(a, 2);
    auto* move = cmd.get();
    h.execute(std::move(cmd), repo);
    assert(move->previousOrder() == std::optional<int>(0));
    assert((orderOf(repo, "deck") == std::vector<std::string>{"B@0", "C@1", "A@2"}));

    h.undo(repo);
    // Siblings keep their renumbered positions.
    assert(repo.getById(a)->order_index == 0);
    assert(repo.getById(b)->order_index == 0);
    assert(repo.getById(c)->order_index == 1);

    h.redo(repo);
    assert((orderOf(repo, "deck") == std::vector<std::string>{"B@0", "C@1", "A@2"}));

    // Out-of-range targets clamp.
    h.execute(std::make_unique<MoveSlideCommand>(a, -4), repo);
    assert((orderOf(repo, "deck") == std::vector<std::string>{"A@0", "B@1", "C@2"}));
}

void test_undo_all_then_redo_all_round_trip() {
    InMemorySlideRepository repo;
    CommandHistory h;
    const std::string a = create(h, repo, "deck", {{"title", "A"}});
    const std::string b = create(h, repo, "deck", {{"title", "B"}, {"layout_type", "blank"}});
    const std::string c = create(h, repo, "deck", {{"title", "C"}});
    h.execute(std::make_unique<UpdateSlideCommand>(b, FieldMap{{"title", "B2"}, {"notes", "speaker"}}), repo);
    h.execute(std::make_unique<MoveSlideCommand>(c, 0), repo);
    h.execute(std::make_unique<UpdateSlideCommand>(a, FieldMap{{"content", {{"k", "v"}}}}), repo);
    h.execute(std::make_unique<DeleteSlideCommand>(b), repo);
    h.execute(std::make_unique<MoveSlideCommand>(a, 5), repo);
    create(h, repo, "deck", {{"title", "D"}}, 1);

    const auto final_state = repo.listByDocument("deck");
    const int n = h.size();

    auto undone = h.undoMany(n, repo);
    assert(static_cast<int>(undone.size()) == n);
    assert(repo.listByDocument("deck").empty());

    auto redone = h.redoMany(n, repo);
    assert(static_cast<int>(redone.size()) == n);
    assert(repo.listByDocument("deck") == final_state);
}

} // namespace

int main() {
    test_create_update_undo_redo_scenario();
    test_create_order_defaults_to_end();
    test_update_snapshots_only_changed_fields();
    test_content_update_bumps_and_restores_version();
    test_update_failures();
    test_undo_fails_when_slide_vanished();
    test_delete_recreates_snapshot();
    test_move_undo_restores_only_moved_slide();
    test_undo_all_then_redo_all_round_trip();
    return 0;
}
