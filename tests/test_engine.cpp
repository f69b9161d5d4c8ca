#include <catch2/catch.hpp>
#include <depwatch/engine.hpp>
#include <depwatch/go/listers.hpp>
#include "fake_lister.hpp"
#include "temp_dir.hpp"

using namespace depwatch;

namespace {

// Go module on disk with a fresh engine over it:
//
//   app (main) -> svc -> util
//   db
struct ModuleFixture {
    TempDir td{"engine"};
    std::unique_ptr<Engine> engine;

    ModuleFixture() {
        td.write_file("go.mod", "module example.com/m\n");
        td.write_file("app/main.go",
            "package main\n\nimport \"example.com/m/svc\"\n\nfunc main() { svc.Run() }\n");
        td.write_file("svc/svc.go",
            "package svc\n\nimport \"example.com/m/util\"\n\nfunc Run() { util.Do() }\n");
        td.write_file("util/util.go", "package util\n\nfunc Do() {}\n");
        td.write_file("db/db.go", "package db\n\nfunc Open() {}\n");
        engine = std::make_unique<Engine>(td.path,
                                          std::make_unique<go::SourceScanUnitLister>());
    }

    std::string abs(const std::string& rel) const { return td.file(rel).string(); }

    bool owned(const std::string& entry, const std::string& rel, FileEvent event) {
        auto r = engine->owned_by(entry, abs(rel), event);
        REQUIRE(r.is_ok());
        return r.value();
    }
};

} // namespace

TEST_CASE("Engine: parse_file_event", "[engine]") {
    REQUIRE(parse_file_event("create").value() == FileEvent::Create);
    REQUIRE(parse_file_event("write").value() == FileEvent::Write);
    REQUIRE(parse_file_event("remove").value() == FileEvent::Remove);
    REQUIRE(parse_file_event("rename").value() == FileEvent::Rename);
    auto bad = parse_file_event("chmod");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == DepwatchError::InvalidInput);
    REQUIRE(std::string(file_event_name(FileEvent::Remove)) == "remove");
}

TEST_CASE("Engine: first query performs the full scan", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.engine->state() == Engine::State::Uninitialized);
    REQUIRE(f.owned("app/main.go", "svc/svc.go", FileEvent::Write));
    REQUIRE(f.engine->state() == Engine::State::Ready);
    REQUIRE(f.engine->rebuild_count() == 1);
    REQUIRE(f.engine->units().size() == 4);
    REQUIRE(f.engine->entry_points().entries() == std::set<std::string>{"example.com/m/app"});
}

TEST_CASE("Engine: an entry point owns its own file", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.owned("app/main.go", "app/main.go", FileEvent::Write));
    REQUIRE(f.owned("app/main.go", "app/main.go", FileEvent::Create));
}

TEST_CASE("Engine: ownership is transitive", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.owned("app/main.go", "util/util.go", FileEvent::Write));
    REQUIRE_FALSE(f.owned("app/main.go", "db/db.go", FileEvent::Write));
}

TEST_CASE("Engine: files outside every unit are not owned", "[engine]") {
    ModuleFixture f;
    f.td.write_file("docs/notes.txt", "hello\n");
    REQUIRE_FALSE(f.owned("app/main.go", "docs/notes.txt", FileEvent::Create));
    REQUIRE_FALSE(f.owned("app/main.go", "docs/never-written.go", FileEvent::Write));

    TempDir elsewhere("outside");
    auto outside = elsewhere.write_file("x/x.go", "package x\n");
    auto r = f.engine->owned_by("app/main.go", outside.string(), FileEvent::Create);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value());
}

TEST_CASE("Engine: editing a non-entry file does not rescan", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.owned("app/main.go", "util/util.go", FileEvent::Write));
    REQUIRE(f.engine->rebuild_count() == 1);

    f.td.write_file("db/db.go", "package db\n\nimport \"example.com/m/util\"\n");
    REQUIRE_FALSE(f.owned("app/main.go", "db/db.go", FileEvent::Write));
    REQUIRE(f.owned("app/main.go", "util/util.go", FileEvent::Write));
    REQUIRE(f.engine->rebuild_count() == 1);
    REQUIRE(f.engine->units().is_stale("example.com/m/db"));
}

TEST_CASE("Engine: repeated queries are idempotent", "[engine]") {
    ModuleFixture f;
    bool first = f.owned("app/main.go", "svc/svc.go", FileEvent::Write);
    bool second = f.owned("app/main.go", "svc/svc.go", FileEvent::Write);
    REQUIRE(first == second);
    REQUIRE(f.engine->rebuild_count() == 1);
}

TEST_CASE("Engine: new import picked up after the entry file changes", "[engine]") {
    TempDir td("engine");
    td.write_file("go.mod", "module example.com/m\n");
    td.write_file("app/main.go", "package main\n\nfunc main() {}\n");
    auto db = td.write_file("db/db.go", "package db\n");
    Engine engine(td.path, std::make_unique<go::SourceScanUnitLister>());

    auto before = engine.owned_by("app/main.go", db.string(), FileEvent::Create);
    REQUIRE(before.is_ok());
    REQUIRE_FALSE(before.value());

    auto main_go = td.write_file("app/main.go",
        "package main\n\nimport \"example.com/m/db\"\n\nfunc main() {}\n");
    REQUIRE(engine.apply_event(FileEvent::Write, main_go.string()).is_ok());
    REQUIRE(engine.rebuild_count() == 2);

    auto after = engine.owned_by("app/main.go", db.string(), FileEvent::Write);
    REQUIRE(after.is_ok());
    REQUIRE(after.value());
}

TEST_CASE("Engine: entry files sharing a name are told apart", "[engine]") {
    TempDir td("engine");
    td.write_file("go.mod", "module example.com/m\n");
    td.write_file("appA/main.go", "package main\n");
    td.write_file("appC/main.go", "package main\n");
    Engine engine(td.path, std::make_unique<go::SourceScanUnitLister>());

    std::string a = td.file("appA/main.go").string();
    REQUIRE(engine.owned_by("appA/main.go", a, FileEvent::Write).value());
    REQUIRE_FALSE(engine.owned_by("appC/main.go", a, FileEvent::Write).value());
}

TEST_CASE("Engine: removed files are no longer owned", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.owned("app/main.go", "util/util.go", FileEvent::Write));

    f.td.remove_file("util/util.go");
    REQUIRE_FALSE(f.owned("app/main.go", "util/util.go", FileEvent::Remove));
    REQUIRE_FALSE(f.owned("app/main.go", "util/util.go", FileEvent::Write));
    REQUIRE(f.engine->units().find("example.com/m/util") == nullptr);
    REQUIRE_FALSE(f.engine->graph().has_edge("example.com/m/svc", "example.com/m/util"));
}

TEST_CASE("Engine: events on a deleted path do not bring the file back", "[engine]") {
    ModuleFixture f;
    f.td.write_file("svc/extra.go", "package svc\n");
    REQUIRE(f.owned("app/main.go", "svc/extra.go", FileEvent::Write));
    REQUIRE(f.engine->units().find("example.com/m/svc")->files.size() == 2);

    f.td.remove_file("svc/extra.go");
    REQUIRE_FALSE(f.owned("app/main.go", "svc/extra.go", FileEvent::Remove));

    SECTION("rename reported at the old path") {
        REQUIRE_FALSE(f.owned("app/main.go", "svc/extra.go", FileEvent::Rename));
    }
    SECTION("late create") {
        REQUIRE_FALSE(f.owned("app/main.go", "svc/extra.go", FileEvent::Create));
    }

    REQUIRE_FALSE(f.owned("app/main.go", "svc/extra.go", FileEvent::Write));
    REQUIRE_FALSE(f.engine->files().owner(f.td.file("svc/extra.go")).has_value());
    REQUIRE(f.engine->units().find("example.com/m/svc")->files.size() == 1);
    REQUIRE(f.engine->rebuild_count() == 1);
}

TEST_CASE("Engine: a rename event without a prior remove drops the old path", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.owned("app/main.go", "svc/svc.go", FileEvent::Write));

    fs::rename(f.td.file("svc/svc.go"), f.td.file("svc/service.go"));
    REQUIRE_FALSE(f.owned("app/main.go", "svc/svc.go", FileEvent::Rename));
    REQUIRE(f.owned("app/main.go", "svc/service.go", FileEvent::Create));
    REQUIRE(f.engine->graph().has_edge("example.com/m/app", "example.com/m/svc"));
}

TEST_CASE("Engine: stale markers are set by non-entry writes only", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.owned("app/main.go", "util/util.go", FileEvent::Write));
    REQUIRE(f.engine->units().is_stale("example.com/m/util"));
    REQUIRE(f.engine->units().stale_count() == 1);

    // A full rebuild re-lists every unit and clears the markers.
    REQUIRE(f.owned("app/main.go", "app/main.go", FileEvent::Write));
    REQUIRE(f.engine->units().stale_count() == 0);
}

TEST_CASE("Engine: removing one of several files keeps the unit", "[engine]") {
    ModuleFixture f;
    f.td.write_file("svc/extra.go", "package svc\n");
    REQUIRE(f.owned("app/main.go", "svc/extra.go", FileEvent::Create));

    f.td.remove_file("svc/svc.go");
    REQUIRE_FALSE(f.owned("app/main.go", "svc/svc.go", FileEvent::Remove));
    REQUIRE(f.owned("app/main.go", "svc/extra.go", FileEvent::Write));
}

TEST_CASE("Engine: a recreated unit is linked back to its importers", "[engine]") {
    ModuleFixture f;
    f.td.remove_file("util/util.go");
    REQUIRE_FALSE(f.owned("app/main.go", "util/util.go", FileEvent::Remove));

    f.td.write_file("util/util.go", "package util\n\nfunc Do() {}\n");
    REQUIRE(f.owned("app/main.go", "util/util.go", FileEvent::Create));
    REQUIRE(f.engine->graph().has_edge("example.com/m/svc", "example.com/m/util"));
    REQUIRE(f.engine->rebuild_count() == 1);
}

TEST_CASE("Engine: a new directory becomes a new unit", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.owned("app/main.go", "svc/svc.go", FileEvent::Write));

    f.td.write_file("tool/main.go", "package main\n\nimport \"example.com/m/db\"\n");
    REQUIRE_FALSE(f.owned("app/main.go", "tool/main.go", FileEvent::Create));
    REQUIRE(f.engine->entry_points().is_entry_point("example.com/m/tool"));
    REQUIRE(f.owned("tool/main.go", "db/db.go", FileEvent::Write));
}

TEST_CASE("Engine: a broken new package is a scan failure", "[engine]") {
    ModuleFixture f;
    f.td.write_file("bad/a.go", "package a\n");
    f.td.write_file("bad/b.go", "package b\n");

    auto r = f.engine->owned_by("app/main.go", f.abs("bad/b.go"), FileEvent::Create);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepwatchError::ScanFailure);
}

TEST_CASE("Engine: rename moves a file between locations", "[engine]") {
    ModuleFixture f;
    REQUIRE(f.owned("app/main.go", "util/util.go", FileEvent::Write));

    fs::rename(f.td.file("util/util.go"), f.td.file("util/helpers.go"));
    REQUIRE(f.engine->rename(f.abs("util/util.go"), f.abs("util/helpers.go")).is_ok());
    REQUIRE_FALSE(f.owned("app/main.go", "util/util.go", FileEvent::Write));
    REQUIRE(f.owned("app/main.go", "util/helpers.go", FileEvent::Write));

    // Watcher-style rename: only the new location is reported.
    fs::rename(f.td.file("util/helpers.go"), f.td.file("util/core.go"));
    REQUIRE(f.engine->apply_event(FileEvent::Remove, f.abs("util/helpers.go")).is_ok());
    REQUIRE(f.owned("app/main.go", "util/core.go", FileEvent::Rename));
}

TEST_CASE("Engine: invalid input", "[engine]") {
    ModuleFixture f;

    SECTION("empty entry handle") {
        auto r = f.engine->owned_by("", f.abs("db/db.go"), FileEvent::Write);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == DepwatchError::InvalidInput);
    }
    SECTION("empty changed file") {
        auto r = f.engine->owned_by("app/main.go", "", FileEvent::Write);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == DepwatchError::InvalidInput);
    }
    SECTION("missing entry file") {
        auto r = f.engine->owned_by("nope/main.go", f.abs("db/db.go"), FileEvent::Write);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == DepwatchError::InvalidInput);
        REQUIRE(f.engine->state() == Engine::State::Uninitialized);
    }
}

TEST_CASE("Engine: entries owning a file name", "[engine]") {
    ModuleFixture f;
    f.td.write_file("tool/main.go", "package main\n\nimport \"example.com/m/util\"\n");

    auto r = f.engine->entries_owning("util.go");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"example.com/m/app", "example.com/m/tool"});

    REQUIRE(f.engine->entries_owning("db.go").value().empty());
    REQUIRE(f.engine->entries_owning("nothing.go").value().empty());
    REQUIRE(f.engine->entries_owning("").is_err());
}

TEST_CASE("Engine: reverse dependency search", "[engine]") {
    ModuleFixture f;

    auto r = f.engine->find_reverse_deps("./...", {"example.com/m/util"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"example.com/m/app", "example.com/m/svc"});

    auto scoped = f.engine->find_reverse_deps("example.com/m/svc/...", {"./util"});
    REQUIRE(scoped.is_ok());
    REQUIRE(scoped.value() == std::vector<std::string>{"example.com/m/svc"});

    auto self = f.engine->find_reverse_deps("example.com/m/util", {"example.com/m/util"});
    REQUIRE(self.value().empty());

    auto none = f.engine->find_reverse_deps("...", {"example.com/other"});
    REQUIRE(none.value().empty());

    REQUIRE(f.engine->find_reverse_deps("", {"x"}).is_err());
}

TEST_CASE("Engine: toolchain imports count as targets", "[engine]") {
    ModuleFixture f;
    f.td.write_file("db/db.go", "package db\n\nimport \"database/sql\"\n");

    auto r = f.engine->find_reverse_deps("...", {"database/sql"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<std::string>{"example.com/m/db"});
}

TEST_CASE("Engine: test imports are opt-in", "[engine]") {
    ModuleFixture f;
    f.td.write_file("app/main_test.go", "package main\n\nimport \"example.com/m/db\"\n");

    REQUIRE_FALSE(f.owned("app/main.go", "db/db.go", FileEvent::Write));

    f.engine->set_test_imports(true);
    REQUIRE(f.engine->state() == Engine::State::Uninitialized);
    REQUIRE(f.owned("app/main.go", "db/db.go", FileEvent::Write));
    REQUIRE(f.engine->rebuild_count() == 2);
    REQUIRE(f.owned("app/main.go", "app/main_test.go", FileEvent::Create));
}

TEST_CASE("Engine: basename fallback for unindexed copies", "[engine]") {
    ModuleFixture f;
    // The scan skips '_' directories, so only the file name can match.
    f.td.write_file("_scratch/util.go", "package util\n");

    SECTION("enabled") {
        REQUIRE(f.owned("app/main.go", "_scratch/util.go", FileEvent::Write));
    }
    SECTION("disabled") {
        Engine strict(f.td.path, std::make_unique<go::SourceScanUnitLister>(),
                      EngineOptions{false, false});
        auto r = strict.owned_by("app/main.go", f.abs("_scratch/util.go"), FileEvent::Write);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.value());
    }
}

TEST_CASE("Engine: lister failure leaves the engine uninitialized", "[engine]") {
    TempDir td("engine");
    td.write_file("app/main.go", "package main\n");

    auto lister = std::make_unique<FakeUnitLister>();
    lister->fail_listing = true;
    FakeUnitLister* raw = lister.get();
    Engine engine(td.path, std::move(lister));

    auto r = engine.owned_by("app/main.go", td.file("app/main.go").string(), FileEvent::Write);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == DepwatchError::ScanFailure);
    REQUIRE(engine.state() == Engine::State::Uninitialized);

    raw->fail_listing = false;
    raw->add(td.path / "app", "m/app", "main", {"main.go"});
    auto retry = engine.owned_by("app/main.go", td.file("app/main.go").string(), FileEvent::Create);
    REQUIRE(retry.is_ok());
    REQUIRE(retry.value());
    REQUIRE(engine.state() == Engine::State::Ready);
    REQUIRE(raw->list_calls == 2);
}

TEST_CASE("Engine: create events only touch the lister for new directories", "[engine]") {
    TempDir td("engine");
    td.write_file("app/main.go", "package main\n");
    td.write_file("db/db.go", "package db\n");

    auto lister = std::make_unique<FakeUnitLister>();
    FakeUnitLister* raw = lister.get();
    raw->add(td.path / "app", "m/app", "main", {"main.go"}, {"m/db"});
    raw->add(td.path / "db", "m/db", "db", {"db.go"});
    Engine engine(td.path, std::move(lister));

    auto extra = td.write_file("db/extra.go", "package db\n");
    REQUIRE(engine.owned_by("app/main.go", extra.string(), FileEvent::Create).value());
    REQUIRE(raw->directory_calls == 0);

    auto txt = td.write_file("db/notes.txt", "");
    REQUIRE_FALSE(engine.owned_by("app/main.go", txt.string(), FileEvent::Create).value());

    auto orphan = td.write_file("loose/x.go", "package x\n");
    REQUIRE_FALSE(engine.owned_by("app/main.go", orphan.string(), FileEvent::Create).value());
    REQUIRE(raw->directory_calls == 1);
    REQUIRE(raw->list_calls == 1);
}
