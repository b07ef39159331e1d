#include "commitgate/hook.hpp"

#include "commitgate/consts.hpp"
#include "commitgate/fs.hpp"

#include <stdexcept>

namespace commitgate {

namespace {

// Single-quote for /bin/sh; embedded quotes become '\''.
std::string sh_quote(const std::string &s) {
  std::string out = "'";
  for (const char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

} // namespace

std::string hook_script(const std::filesystem::path &program) {
  std::string script = "#!/bin/sh\n";
  script += consts::kHookMarker;
  script += "\nexec " + sh_quote(program.string()) + " run \"$@\"\n";
  return script;
}

std::filesystem::path install_hook(const Repository &repo, const std::filesystem::path &program,
                                   bool force) {
  const auto hook = repo.pre_commit_hook();
  if (fs::exists(hook) && !force) {
    const std::string existing = fs::read_text(hook);
    if (existing.find(consts::kHookMarker) == std::string::npos) {
      throw std::runtime_error(hook.string() +
                               " exists and was not written by commitgate (use --force)");
    }
  }
  fs::write_text_atomic(hook, hook_script(program));
  fs::make_executable(hook);
  return hook;
}

} // namespace commitgate
