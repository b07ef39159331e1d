#pragma once
#include "commitgate/repo.hpp"

#include <filesystem>
#include <string>

namespace commitgate {

// Shell script that hands the commit over to `<program> run`.
std::string hook_script(const std::filesystem::path &program);

// Write the pre-commit hook of `repo` and make it executable. A hook that
// commitgate did not write is only replaced with `force`; otherwise
// std::runtime_error. Returns the hook path.
std::filesystem::path install_hook(const Repository &repo, const std::filesystem::path &program,
                                   bool force);

} // namespace commitgate
