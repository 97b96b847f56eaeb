#include "engine/workspace.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runner {
using namespace std;

static string random_workspace_name() {
    thread_local boost::uuids::random_generator generator;
    return "run-" + boost::lexical_cast<string>(generator());
}

workspace::workspace(const filesystem::path &run_dir, language lang, const string &code)
    : lang(lang) {
    try {
        create(run_dir, code);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to create workspace, retrying: " << ex.what();
        try {
            create(run_dir, code);
        } catch (std::exception &ex) {
            throw workspace_error(fmt::format("Unable to create workspace in {}: {}", run_dir.string(), ex.what()));
        }
    }
}

void workspace::create(const filesystem::path &run_dir, const string &code) {
    filesystem::create_directories(run_dir);
    filesystem::path dir = run_dir / assert_safe_path(random_workspace_name());
    if (!filesystem::create_directory(dir))
        throw workspace_error(fmt::format("Workspace {} already exists", dir.string()));
    root = dir;
    try {
        filesystem::permissions(dir, filesystem::perms::owner_all, filesystem::perm_options::replace);
        write_file_content(source_file(), code);
    } catch (...) {
        error_code ec;
        filesystem::remove_all(dir, ec);
        root.clear();
        throw;
    }
}

workspace::~workspace() {
    if (root.empty()) return;
    error_code ec;
    filesystem::remove_all(root, ec);
    if (ec) LOG(ERROR) << "Unable to remove workspace " << root << ": " << ec.message();
}

const filesystem::path &workspace::root_dir() const {
    return root;
}

filesystem::path workspace::source_file() const {
    return root / source_name();
}

string workspace::source_name() const {
    return "main" + get_language_info(lang).extension;
}

workspace_manager::workspace_manager(const filesystem::path &run_dir) : dir(run_dir) {}

unique_ptr<workspace> workspace_manager::acquire(language lang, const string &code) const {
    return make_unique<workspace>(dir, lang, code);
}

size_t workspace_manager::clean_stale() const {
    size_t removed = 0;
    if (!filesystem::is_directory(dir)) return removed;
    for (auto &entry : filesystem::directory_iterator(dir)) {
        string name = entry.path().filename().string();
        if (!entry.is_directory() || name.rfind("run-", 0) != 0) continue;
        error_code ec;
        filesystem::remove_all(entry.path(), ec);
        if (ec)
            LOG(WARNING) << "Unable to remove stale workspace " << entry.path() << ": " << ec.message();
        else
            ++removed;
    }
    return removed;
}

const filesystem::path &workspace_manager::run_dir() const {
    return dir;
}

}  // namespace runner
