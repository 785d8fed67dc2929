#include "folio/command_registry.hpp"
#include "folio/config.hpp"
#include "folio/db.hpp"
#include "folio/document_histories.hpp"
#include "folio/errors.hpp"
#include "folio/slide_editor.hpp"
#include <iostream>
#include <memory>
#include <string>

using namespace folio;

static void printStatus(SlideEditor& editor, const std::string& doc) {
    auto s = editor.status(doc);
    std::cout << "History: undo=" << s.undo_count << " redo=" << s.redo_count << "\n";
}

int main(int argc, char** argv) {
    // Demo runner: edits one deck in memory, or in SQLite when --db is provided
    EditorConfig cfg;
    try {
        cfg = EditorConfig::fromArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    std::unique_ptr<ISlideRepository> repo;
    IHistoryStore* store = nullptr;
    try {
        if (!cfg.db_path.empty()) {
            auto sql = std::make_unique<SqliteStorage>(cfg.db_path);
            store = sql.get();
            repo = std::move(sql);
        } else {
            repo = std::make_unique<InMemorySlideRepository>();
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Storage error: " << e.what() << "\n";
        return 1;
    }

    CommandRegistry registry;
    registerSlideCommands(registry);
    DocumentHistories histories(cfg.max_history);
    SlideEditor editor(*repo, histories, store);
    const std::string& doc = cfg.document_id;

    try {
        if (cfg.restore) {
            if (!editor.restoreHistory(doc, registry)) {
                std::cerr << "No stored history for " << doc << "\n";
                return 1;
            }
            std::cout << "Restored history for " << doc << "\n";
            printStatus(editor, doc);
            auto slides = repo->listByDocument(doc);
            if (!slides.empty()) {
                auto r = editor.undo(doc, slides.front().id);
                std::cout << r.description << "\n";
            }
            printStatus(editor, doc);
            return 0;
        }

        auto intro = editor.createSlide(doc, {{"title", "Intro"}});
        std::cout << "Executed CreateSlide " << intro.id << "\n";
        auto agenda = editor.createSlide(doc, {{"title", "Agenda"}, {"layout_type", "two_column"}});
        std::cout << "Executed CreateSlide " << agenda.id << "\n";

        editor.updateSlide(doc, intro.id, {{"title", "Welcome"}, {"notes", "Smile"}});
        std::cout << "Executed UpdateSlide\n";
        editor.moveSlide(doc, agenda.id, 0);
        std::cout << "Executed MoveSlide\n";

        auto undone = editor.undo(doc, agenda.id);
        std::cout << undone.description << "\n";
        auto redone = editor.redo(doc, agenda.id);
        std::cout << redone.description << "\n";

        for (const auto& s : repo->listByDocument(doc)) {
            std::cout << "  [" << s.order_index << "] " << s.title << "\n";
        }
        printStatus(editor, doc);
    } catch (const CommandError& e) {
        std::cerr << e.what() << " (" << e.commandType() << " " << e.commandId() << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
