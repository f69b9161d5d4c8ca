#include <depwatch/engine.hpp>
#include <depwatch/log.hpp>
#include <depwatch/path_utils.hpp>
#include <algorithm>
#include <unordered_set>

namespace depwatch {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

Result<FileEvent> parse_file_event(const std::string& name) {
    if (name == "create") return Result<FileEvent>::ok(FileEvent::Create);
    if (name == "write")  return Result<FileEvent>::ok(FileEvent::Write);
    if (name == "remove") return Result<FileEvent>::ok(FileEvent::Remove);
    if (name == "rename") return Result<FileEvent>::ok(FileEvent::Rename);
    return DepwatchError{DepwatchError::InvalidInput,
        "unknown file event '" + name + "'",
        "expected one of: create, write, remove, rename"};
}

const char* file_event_name(FileEvent event) {
    switch (event) {
        case FileEvent::Create: return "create";
        case FileEvent::Write:  return "write";
        case FileEvent::Remove: return "remove";
        case FileEvent::Rename: return "rename";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Construction and full scans
// ---------------------------------------------------------------------------

Engine::Engine(fs::path root, std::unique_ptr<UnitLister> lister, EngineOptions options)
    : root_(canonical_path(root.empty() ? fs::path(".") : root)),
      lister_(std::move(lister)),
      options_(options) {
    units_.set_include_tests(options_.test_imports);
}

OwnershipResolver Engine::resolver() const {
    return OwnershipResolver(root_, units_, files_, graph_, entries_,
                             options_.basename_fallback);
}

Status Engine::ensure_ready() {
    if (state_ == State::Ready) return ok_status();
    return rebuild();
}

Status Engine::rebuild() {
    if (!lister_) {
        return DepwatchError{DepwatchError::InvalidInput, "engine has no unit lister"};
    }

    if (state_ == State::Ready && units_.stale_count() > 0) {
        log::debug("rebuild refreshes %zu stale units", units_.stale_count());
    }
    state_ = State::Uninitialized;

    UnitIndex fresh;
    fresh.set_include_tests(options_.test_imports);
    auto loaded = fresh.load(*lister_, root_);
    if (loaded.is_err()) {
        log::debug("full scan of %s failed: %s", root_.string().c_str(),
                   loaded.error().message.c_str());
        return std::move(loaded).error();
    }

    units_ = std::move(fresh);
    files_.rebuild(units_);
    graph_.clear();
    for (const Unit* unit : units_.units()) {
        graph_.set_edges(unit->identifier, unit->dependencies);
    }
    entries_.rebuild(units_);

    auto order = graph_.topological_order();
    if (order.is_err()) {
        log::warn("%s", order.error().message.c_str());
    }

    state_ = State::Ready;
    ++rebuild_count_;
    log::info("indexed %zu units (%zu entry points, %zu files) under %s",
              units_.size(), entries_.size(), files_.size(), root_.string().c_str());
    return ok_status();
}

void Engine::set_test_imports(bool enabled) {
    if (options_.test_imports == enabled) return;
    options_.test_imports = enabled;
    units_.set_include_tests(enabled);
    state_ = State::Uninitialized;
    log::debug("test imports %s, cache invalidated", enabled ? "enabled" : "disabled");
}

// ---------------------------------------------------------------------------
// Incremental updates
// ---------------------------------------------------------------------------

void Engine::link_unit(const Unit& unit) {
    graph_.set_edges(unit.identifier, unit.dependencies);

    // Importers listed before this unit existed had their edge pruned when it
    // went away (or never had one); restore it from their metadata.
    for (const Unit* other : units_.units()) {
        if (other->identifier == unit.identifier) continue;
        if (std::binary_search(other->dependencies.begin(), other->dependencies.end(),
                               unit.identifier)) {
            graph_.add_edge(other->identifier, unit.identifier);
        }
    }

    for (const auto& file : unit.files) {
        files_.insert(file, unit.identifier);
    }
    if (unit.entry_point) {
        entries_.add(unit.identifier);
    } else {
        entries_.remove(unit.identifier);
    }
}

Status Engine::handle_create(const fs::path& file) {
    if (!path_within(file, root_)) {
        log::trace("ignoring %s, outside %s", file.string().c_str(), root_.string().c_str());
        return ok_status();
    }
    if (!lister_->is_source_file(file, options_.test_imports)) {
        return ok_status();
    }
    // Watchers report renames at the old path too; a file that is gone
    // must not rejoin its unit.
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        log::trace("ignoring create of %s, not on disk", file.string().c_str());
        return ok_status();
    }
    if (files_.owner(file)) {
        return ok_status();
    }

    fs::path dir = file.parent_path();
    if (const Unit* unit = units_.find_by_directory(dir)) {
        units_.add_file(unit->identifier, file);
        files_.insert(file, unit->identifier);
        log::debug("create: %s joins %s", file.string().c_str(), unit->identifier.c_str());
        return ok_status();
    }

    auto scanned = units_.rescan(*lister_, root_, dir);
    if (scanned.is_err()) {
        if (scanned.error().code == DepwatchError::NotFound) {
            log::debug("create: %s is not part of any unit", file.string().c_str());
            return ok_status();
        }
        return std::move(scanned).with_code(DepwatchError::ScanFailure).error();
    }

    const Unit* unit = scanned.value();
    link_unit(*unit);
    log::debug("create: new unit %s (%zu files, %zu dependencies)",
               unit->identifier.c_str(), unit->files.size(), unit->dependencies.size());
    return ok_status();
}

Status Engine::handle_remove(const fs::path& file) {
    auto owner = files_.owner(file);
    if (!owner) return ok_status();

    std::string id = *owner;
    files_.remove(file);
    size_t remaining = units_.remove_file(id, file);
    if (remaining == 0) {
        units_.erase(id);
        graph_.remove_unit(id);
        entries_.remove(id);
        files_.remove_unit(id);
        log::debug("remove: unit %s has no files left, dropped", id.c_str());
    } else {
        log::debug("remove: %s leaves %s", file.string().c_str(), id.c_str());
    }
    return ok_status();
}

Status Engine::handle_write(const fs::path& file, const fs::path& entry_file) {
    auto owner = files_.owner(file);
    bool entry_changed = !entry_file.empty() && file == entry_file;
    if (entry_changed || (owner && entries_.is_entry_point(*owner))) {
        log::debug("write: entry file %s changed, rebuilding", file.string().c_str());
        return rebuild();
    }
    if (owner) {
        units_.invalidate(*owner);
        log::trace("write: %s marked stale", owner->c_str());
    }
    return ok_status();
}

Status Engine::apply(FileEvent event, const fs::path& file, const fs::path& entry_file) {
    switch (event) {
        case FileEvent::Create:
            return handle_create(file);
        case FileEvent::Remove:
            return handle_remove(file);
        case FileEvent::Rename:
            // The watcher reports the new location only.
            DEPWATCH_TRY(handle_remove(file));
            return handle_create(file);
        case FileEvent::Write:
            return handle_write(file, entry_file);
    }
    return ok_status();
}

Status Engine::apply_event(FileEvent event, const std::string& file) {
    if (file.empty()) {
        return DepwatchError{DepwatchError::InvalidInput, "file path cannot be empty"};
    }
    DEPWATCH_TRY(ensure_ready());
    return apply(event, canonical_path(file), fs::path());
}

Status Engine::rename(const std::string& old_path, const std::string& new_path) {
    if (old_path.empty() || new_path.empty()) {
        return DepwatchError{DepwatchError::InvalidInput, "rename paths cannot be empty"};
    }
    DEPWATCH_TRY(ensure_ready());
    DEPWATCH_TRY(handle_remove(canonical_path(old_path)));
    return handle_create(canonical_path(new_path));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

Result<bool> Engine::owned_by(const std::string& entry_handle,
                              const std::string& changed_file,
                              FileEvent event) {
    if (entry_handle.empty()) {
        return DepwatchError{DepwatchError::InvalidInput, "entry handle cannot be empty"};
    }
    if (changed_file.empty()) {
        return DepwatchError{DepwatchError::InvalidInput, "changed file cannot be empty"};
    }

    fs::path entry_file = canonical_path(entry_handle, root_);
    std::error_code ec;
    if (!fs::is_regular_file(entry_file, ec)) {
        return DepwatchError{DepwatchError::InvalidInput,
            "entry file does not exist: " + entry_file.string(),
            "entry handles are resolved relative to " + root_.string()};
    }

    fs::path changed = canonical_path(changed_file);

    DEPWATCH_TRY(ensure_ready());
    DEPWATCH_TRY(apply(event, changed, entry_file));

    auto view = resolver();
    auto entry = view.resolve_entry(entry_handle);
    if (entry.is_err()) return std::move(entry).error();

    bool owned = view.owned_by(changed, entry.value());
    log::trace("%s %s: owned by %s = %s", file_event_name(event),
               changed.string().c_str(), entry_handle.c_str(), owned ? "yes" : "no");
    return Result<bool>::ok(owned);
}

Result<std::vector<std::string>> Engine::entries_owning(const std::string& file_basename) {
    std::string name = fs::path(file_basename).filename().string();
    if (name.empty()) {
        return DepwatchError{DepwatchError::InvalidInput, "file name cannot be empty"};
    }
    DEPWATCH_TRY(ensure_ready());
    return Result<std::vector<std::string>>::ok(resolver().entries_owning(name));
}

bool Engine::matches_pattern(const std::string& pattern, const Unit& unit) const {
    static const std::string kWildcard = "...";
    static const std::string kSubtree = "/...";

    std::string pat = pattern;
    std::string subject;
    if (pat == "." || pat.rfind("./", 0) == 0) {
        subject = unit.directory.lexically_relative(root_).generic_string();
        pat = pat.size() > 2 ? pat.substr(2) : ".";
    } else {
        subject = unit.identifier;
    }

    if (pat == kWildcard) return true;
    if (pat.size() > kSubtree.size() &&
        pat.compare(pat.size() - kSubtree.size(), kSubtree.size(), kSubtree) == 0) {
        std::string prefix = pat.substr(0, pat.size() - kSubtree.size());
        if (prefix == ".") return true;
        return subject == prefix || subject.rfind(prefix + "/", 0) == 0;
    }
    return subject == pat;
}

Result<std::vector<std::string>> Engine::find_reverse_deps(
        const std::string& source_pattern,
        const std::vector<std::string>& target_patterns) {
    if (source_pattern.empty()) {
        return DepwatchError{DepwatchError::InvalidInput, "source pattern cannot be empty"};
    }
    DEPWATCH_TRY(ensure_ready());

    auto all = units_.units();
    std::unordered_set<std::string> targets;
    for (const auto& pattern : target_patterns) {
        if (pattern.empty()) {
            return DepwatchError{DepwatchError::InvalidInput, "target pattern cannot be empty"};
        }
        bool matched = false;
        for (const Unit* unit : all) {
            if (matches_pattern(pattern, *unit)) {
                targets.insert(unit->identifier);
                matched = true;
            }
        }
        // A plain identifier nobody indexed may still be imported (toolchain
        // packages), so it stays a valid target.
        bool literal = pattern.find("...") == std::string::npos && pattern.rfind("./", 0) != 0;
        if (!matched && literal) {
            targets.insert(pattern);
        } else if (!matched) {
            log::debug("target pattern %s matches no unit", pattern.c_str());
        }
    }

    std::vector<std::string> result;
    for (const Unit* unit : all) {
        if (!matches_pattern(source_pattern, *unit)) continue;
        const auto& reach = graph_.closure(unit->identifier);
        for (const auto& t : targets) {
            if (t != unit->identifier && reach.count(t)) {
                result.push_back(unit->identifier);
                break;
            }
        }
    }
    return Result<std::vector<std::string>>::ok(std::move(result));
}

} // namespace depwatch
