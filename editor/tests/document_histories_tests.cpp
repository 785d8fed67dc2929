// Per-document histories, session locking and the SlideEditor service.
#include "folio/command_registry.hpp"
#include "folio/document_histories.hpp"
#include "folio/errors.hpp"
#include "folio/slide_editor.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace folio;

namespace {

void test_lazy_creation_and_isolation() {
    DocumentHistories histories(7);
    assert(histories.size() == 0);
    assert(!histories.contains("deck-a"));

    InMemorySlideRepository repo;
    SlideEditor editor(repo, histories);
    editor.createSlide("deck-a", {{"title", "A"}});
    assert(histories.contains("deck-a"));
    assert(!histories.contains("deck-b"));

    {
        auto session = histories.acquire("deck-b");
        assert(session.documentId() == "deck-b");
        assert(session->size() == 0);
        assert(session->maxHistory() == 7);
    }
    assert(histories.size() == 2);
    assert(histories.acquire("deck-a")->size() == 1);

    histories.clear("deck-a");
    assert(histories.acquire("deck-a")->size() == 0);
    histories.clear("never-seen");
    assert(!histories.contains("never-seen"));
}

void test_session_excludes_same_document() {
    DocumentHistories histories;
    std::atomic<bool> entered{false};
    std::thread other;
    {
        auto session = histories.acquire("deck");
        other = std::thread([&] {
            auto s = histories.acquire("deck");
            entered = true;
        });
        // A different document is not blocked.
        auto unrelated = histories.acquire("other-deck");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(!entered.load());
    }
    other.join();
    assert(entered.load());
}

void test_parallel_documents() {
    InMemorySlideRepository repo;
    DocumentHistories histories(5);
    SlideEditor editor(repo, histories);
    constexpr int kDocs = 6;
    constexpr int kEdits = 12;

    std::vector<std::thread> workers;
    for (int d = 0; d < kDocs; ++d) {
        workers.emplace_back([&, d] {
            const std::string doc = "deck-" + std::to_string(d);
            auto slide = editor.createSlide(doc, {{"title", "start"}});
            for (int i = 0; i < kEdits; ++i) {
                editor.updateSlide(doc, slide.id, {{"title", doc + "-" + std::to_string(i)}});
            }
        });
    }
    for (auto& w : workers) w.join();

    assert(histories.size() == static_cast<std::size_t>(kDocs));
    for (int d = 0; d < kDocs; ++d) {
        const std::string doc = "deck-" + std::to_string(d);
        auto st = editor.status(doc);
        assert(st.undo_count == 5);
        assert(st.redo_count == 0);
        auto slides = repo.listByDocument(doc);
        assert(slides.size() == 1);
        assert(slides[0].title == doc + "-" + std::to_string(kEdits - 1));
    }
}

void test_concurrent_edits_on_one_document() {
    InMemorySlideRepository repo;
    DocumentHistories histories(100);
    SlideEditor editor(repo, histories);
    auto slide = editor.createSlide("deck", {{"title", "base"}});

    constexpr int kThreads = 4;
    constexpr int kEdits = 10;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kEdits; ++i) {
                editor.updateSlide("deck", slide.id, {{"notes", std::to_string(t) + ":" + std::to_string(i)}});
            }
        });
    }
    for (auto& w : workers) w.join();

    assert(editor.status("deck").undo_count == 1 + kThreads * kEdits);
    // Every edit captured the state left by the one before it, so undoing
    // them all lands exactly on the original slide.
    for (int i = 0; i < kThreads * kEdits; ++i) {
        assert(editor.undo("deck", slide.id).success);
    }
    assert(*repo.getById(slide.id) == slide);
}

void test_editor_undo_redo_results() {
    InMemorySlideRepository repo;
    DocumentHistories histories;
    SlideEditor editor(repo, histories);

    auto none = editor.undo("deck", "whatever");
    assert(!none.success);
    assert(none.description == "Nothing to undo");
    assert(!none.state.has_value());
    assert(!none.can_undo && !none.can_redo);

    auto s = editor.createSlide("deck", {{"title", "Draft"}});
    auto updated = editor.updateSlide("deck", s.id, {{"title", "Final"}, {"text_color", "#222"}});
    assert(updated.title == "Final");
    assert(updated.text_color == std::optional<std::string>("#222"));

    auto r = editor.undo("deck", s.id);
    assert(r.success);
    assert(r.description == "Undid UpdateSlide");
    assert(r.state.has_value() && r.state->title == "Draft");
    assert(!r.state->text_color.has_value());
    assert(r.can_undo && r.can_redo);

    auto status = editor.status("deck");
    assert(status.undo_count == 1 && status.redo_count == 1);

    auto again = editor.redo("deck", s.id);
    assert(again.success);
    assert(again.description == "Redid UpdateSlide");
    assert(again.state->title == "Final");
    assert(!again.can_redo);

    auto tip = editor.redo("deck", s.id);
    assert(!tip.success);
    assert(tip.description == "Nothing to redo");
    assert(tip.state.has_value());

    editor.deleteSlide("deck", s.id);
    auto restored = editor.undo("deck", s.id);
    assert(restored.description == "Undid DeleteSlide");
    assert(restored.state.has_value() && restored.state->title == "Final");

    auto second = editor.createSlide("deck", {{"title", "Second"}});
    auto moved = editor.moveSlide("deck", second.id, 0);
    assert(moved.order_index == 0);
    assert(repo.getById(s.id)->order_index == 1);

    bool threw = false;
    try {
        editor.updateSlide("deck", second.id, {{"colour", "red"}});
    } catch (const ExecutionError& e) {
        threw = true;
        assert(e.commandType() == "UpdateSlideCommand");
    }
    assert(threw);

    // A missing slide is rejected before any command is built.
    const int before = editor.status("deck").undo_count;
    threw = false;
    try {
        editor.updateSlide("deck", "missing", {{"title", "x"}});
    } catch (const ExecutionError&) {
        assert(false);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(editor.status("deck").undo_count == before);

    editor.clearHistory("deck");
    auto cleared = editor.status("deck");
    assert(!cleared.can_undo && !cleared.can_redo);
    assert(repo.getById(second.id).has_value());
}

template <typename Fn>
bool rejectsSlide(Fn&& fn) {
    try {
        fn();
    } catch (const CommandError&) {
        return false;
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void test_editor_rejects_slides_of_other_documents() {
    InMemorySlideRepository repo;
    DocumentHistories histories;
    SlideEditor editor(repo, histories);
    auto mine = editor.createSlide("deck-a", {{"title", "Mine"}});
    auto theirs = editor.createSlide("deck-b", {{"title", "Theirs"}});

    assert(rejectsSlide([&] { editor.updateSlide("deck-a", theirs.id, {{"title", "hijacked"}}); }));
    assert(rejectsSlide([&] { editor.moveSlide("deck-a", theirs.id, 0); }));
    assert(rejectsSlide([&] { editor.deleteSlide("deck-a", theirs.id); }));

    auto stored = repo.getById(theirs.id);
    assert(stored.has_value() && *stored == theirs);
    assert(editor.status("deck-a").undo_count == 1);
    assert(editor.status("deck-b").undo_count == 1);

    // The owning document still edits it normally.
    assert(editor.updateSlide("deck-b", theirs.id, {{"title", "Edited"}}).title == "Edited");
    assert(editor.updateSlide("deck-a", mine.id, {{"title", "Also edited"}}).title == "Also edited");
}

void test_editor_export_import() {
    CommandRegistry registry;
    registerSlideCommands(registry);
    InMemorySlideRepository repo;
    DocumentHistories histories;
    SlideEditor editor(repo, histories);

    auto s = editor.createSlide("deck", {{"title", "One"}});
    editor.updateSlide("deck", s.id, {{"title", "Two"}});
    const json exported = editor.exportHistory("deck");
    assert(exported["current_index"] == 1);

    // A fresh registry of histories, e.g. after a restart, picks up the old one.
    DocumentHistories fresh;
    SlideEditor restarted(repo, fresh);
    restarted.importHistory("deck", exported, registry);
    auto r = restarted.undo("deck", s.id);
    assert(r.success && r.state->title == "One");
    assert(restarted.exportHistory("deck")["current_index"] == 0);
    assert(!restarted.restoreHistory("deck", registry)); // no store attached
}

} // namespace

int main() {
    test_lazy_creation_and_isolation();
    test_session_excludes_same_document();
    test_parallel_documents();
    test_concurrent_edits_on_one_document();
    test_editor_undo_redo_results();
    test_editor_rejects_slides_of_other_documents();
    test_editor_export_import();
    return 0;
}
