#pragma once

#include "sandbox/sandbox.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace nucleobench::sandbox::testing {

// Behavior of every sandbox the fake provisions.
struct FakeSandboxScript {
  bool fail_provision = false;
  bool fail_copy_in = false;
  bool fail_execute = false;
  // Execute reports `timed_out` instead of an exit code.
  bool time_out = false;
  int exit_code = 0;
  std::chrono::milliseconds exec_wall_time{5};
  // Real time each CopyOut takes. A copy slower than its timeout sleeps for
  // the timeout and then fails.
  std::chrono::milliseconds copy_out_delay{0};
  // Written to the capture path by Execute.
  std::string console_output;
  // Files produced by the task script, keyed by sandbox path. CopyOut of a
  // path missing here fails.
  std::map<std::string, std::string> produced_files;
};

// Scripted in-memory sandbox used by adapter and scheduler tests to exercise
// lifecycle handling without docker.
class FakeSandbox final : public ISandbox {
public:
  explicit FakeSandbox(FakeSandboxScript script = {});

  void SetScript(FakeSandboxScript script);

  bool Provision(const SandboxRequest& request, SandboxHandle& handle,
                 std::string& error) override;
  bool CopyIn(const SandboxHandle& handle, const std::filesystem::path& host_path,
              const std::string& sandbox_path, std::chrono::milliseconds timeout,
              std::string& error) override;
  bool Execute(const SandboxHandle& handle, const std::vector<std::string>& command,
               std::chrono::milliseconds timeout, const std::filesystem::path& capture_path,
               SandboxExecResult& result, std::string& error) override;
  bool CopyOut(const SandboxHandle& handle, const std::string& sandbox_path,
               const std::filesystem::path& host_path, std::chrono::milliseconds timeout,
               std::string& error) override;
  bool Teardown(SandboxHandle& handle, std::string& error) override;

  std::size_t provision_count() const;
  std::size_t teardown_count() const;
  std::size_t execute_count() const;
  // Provisioned sandboxes not yet torn down.
  std::size_t live_count() const;
  const std::vector<SandboxRequest>& requests() const;
  const std::vector<std::string>& copied_in_paths() const;
  // Contents of the last file copied to `sandbox_path`.
  std::string CopiedInContents(const std::string& sandbox_path) const;
  std::chrono::milliseconds last_exec_timeout() const;
  std::size_t copy_out_count() const;
  std::chrono::milliseconds last_copy_out_timeout() const;

private:
  FakeSandboxScript script_;
  std::size_t provision_count_ = 0U;
  std::size_t teardown_count_ = 0U;
  std::size_t execute_count_ = 0U;
  std::vector<SandboxRequest> requests_;
  std::vector<std::string> copied_in_paths_;
  std::map<std::string, std::string> copied_in_contents_;
  std::chrono::milliseconds last_exec_timeout_{0};
  std::size_t copy_out_count_ = 0U;
  std::chrono::milliseconds last_copy_out_timeout_{0};
};

} // namespace nucleobench::sandbox::testing
