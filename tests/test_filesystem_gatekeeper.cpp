#include "test_framework.hpp"

#include "mnemobox/sandbox/filesystem_gatekeeper.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

namespace sb = mnemobox::sandbox;

sb::FilesystemRules rules_for(const std::filesystem::path &root, const bool read_only = true) {
  sb::FilesystemRules rules;
  rules.allowed_paths = {root};
  rules.read_only = read_only;
  return rules;
}

} // namespace

void register_filesystem_gatekeeper_tests(std::vector<mnemobox::tests::TestCase> &tests) {
  using mnemobox::tests::require;
  using mnemobox::testing::TempWorkspace;

  tests.push_back({"fs_gatekeeper_denies_everything_without_roots", [] {
                     const sb::FilesystemGatekeeper gatekeeper(sb::FilesystemRules{});
                     require(!gatekeeper.permit("/tmp/file.txt"), "deny-all gatekeeper allowed a path");
                     require(!gatekeeper.permit("relative.txt"), "deny-all allowed a relative path");
                   }});

  tests.push_back({"fs_gatekeeper_allows_paths_under_root", [] {
                     TempWorkspace workspace;
                     workspace.create_file("data/input.json", "{}");
                     const sb::FilesystemGatekeeper gatekeeper(rules_for(workspace.path()));
                     const auto checked = gatekeeper.check((workspace.path() / "data/input.json").string());
                     require(checked.ok(), checked.ok() ? "" : checked.error());
                     require(checked.value() == workspace.path() / "data/input.json",
                             "normalized path mismatch");
                     require(gatekeeper.permit(workspace.path().string() + "/"), "root itself denied");
                   }});

  tests.push_back({"fs_gatekeeper_anchors_relative_paths_at_first_root", [] {
                     TempWorkspace workspace;
                     const sb::FilesystemGatekeeper gatekeeper(rules_for(workspace.path()));
                     const auto checked = gatekeeper.check("notes/today.txt");
                     require(checked.ok(), checked.ok() ? "" : checked.error());
                     require(checked.value() == workspace.path() / "notes/today.txt",
                             "relative path not anchored at the root");
                   }});

  tests.push_back({"fs_gatekeeper_rejects_traversal_regardless_of_roots", [] {
                     const sb::FilesystemGatekeeper gatekeeper(rules_for("/"));
                     require(!gatekeeper.permit("../../../etc/passwd"), "plain traversal allowed");
                     require(!gatekeeper.permit("/tmp/../etc/passwd"), "embedded traversal allowed");
                     require(!gatekeeper.permit("%2e%2e%2fetc%2fpasswd"), "encoded traversal allowed");
                     require(!gatekeeper.permit("%252e%252e%252fetc"), "double encoding allowed");
                     require(!gatekeeper.permit("..\\..\\windows"), "backslash traversal allowed");
                     require(!gatekeeper.permit(std::string("/tmp/a\0b", 8)), "NUL byte allowed");
                     require(!gatekeeper.permit("/tmp/a%00b"), "encoded NUL allowed");
                   }});

  tests.push_back({"fs_gatekeeper_rejects_control_and_invisible_characters", [] {
                     const sb::FilesystemGatekeeper gatekeeper(rules_for("/tmp"));
                     require(!gatekeeper.permit("/tmp/a\nb"), "newline allowed");
                     require(!gatekeeper.permit("/tmp/a\xE2\x80\x8B" "b"), "zero-width space allowed");
                     require(!gatekeeper.permit("/tmp/\xE2\x80\xAEtxt.exe"), "bidi override allowed");
                   }});

  tests.push_back({"fs_gatekeeper_rejects_sibling_prefix", [] {
                     TempWorkspace workspace;
                     const auto root = workspace.path() / "work";
                     std::filesystem::create_directories(root);
                     const sb::FilesystemGatekeeper gatekeeper(rules_for(root));
                     require(!gatekeeper.permit((workspace.path() / "workshop/file").string()),
                             "sibling directory sharing a prefix allowed");
                     require(!gatekeeper.permit("/etc/passwd"), "outside path allowed");
                   }});

  tests.push_back({"fs_gatekeeper_enforces_depth_limit", [] {
                     sb::FilesystemRules rules = rules_for("/tmp");
                     rules.max_path_depth = 3;
                     const sb::FilesystemGatekeeper gatekeeper(rules);
                     require(gatekeeper.permit("/tmp/a/b"), "shallow path denied");
                     const auto deep = gatekeeper.check("/tmp/a/b/c/d");
                     require(!deep.ok(), "deep path allowed");
                     require(deep.error().find("depth") != std::string::npos, "unexpected reason");
                   }});

  tests.push_back({"fs_gatekeeper_read_only_blocks_writes", [] {
                     TempWorkspace workspace;
                     const sb::FilesystemGatekeeper read_only(rules_for(workspace.path(), true));
                     require(read_only.permit("file.txt", sb::AccessIntent::Read), "read denied");
                     require(!read_only.permit("file.txt", sb::AccessIntent::Write), "write allowed");
                     require(!read_only.permit("file.txt", sb::AccessIntent::Delete), "delete allowed");

                     const sb::FilesystemGatekeeper writable(rules_for(workspace.path(), false));
                     require(writable.permit("file.txt", sb::AccessIntent::Create), "create denied");
                   }});

  tests.push_back({"fs_gatekeeper_refuses_symlink_escape", [] {
                     TempWorkspace workspace;
                     std::error_code ec;
                     std::filesystem::create_directory_symlink("/etc", workspace.path() / "etc-link", ec);
                     require(!ec, "unable to create symlink: " + ec.message());

                     const sb::FilesystemGatekeeper strict(rules_for(workspace.path()));
                     require(!strict.permit((workspace.path() / "etc-link/passwd").string()),
                             "symlink traversal allowed");

                     sb::FilesystemRules following = rules_for(workspace.path());
                     following.follow_symlinks = true;
                     const sb::FilesystemGatekeeper resolving(following);
                     require(!resolving.permit((workspace.path() / "etc-link/passwd").string()),
                             "resolved symlink outside root allowed");
                   }});

  tests.push_back({"fs_percent_decode_keeps_malformed_escapes", [] {
                     require(sb::percent_decode("a%20b") == "a b", "space not decoded");
                     require(sb::percent_decode("100%") == "100%", "trailing percent altered");
                     require(sb::percent_decode("%zz") == "%zz", "malformed escape altered");
                   }});
}
