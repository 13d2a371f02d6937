// Copyright (c) 2025 R.J. (kencube@hotmail.com)
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#include <windows.h>
#include <cstring>
#include <TlHelp32.h>
#include <stdexcept>

namespace process_lib {

template <>
void maybe_quote_arg<char>(std::string& arg) {
  auto it = arg.find_first_of(" \t\""); // contains space or double quotes?
  if(it != arg.npos) {
    // double existing quotes
    common::string_replace_all<char>(arg, "\"", "\"\"");
    // surround with quotes
    arg.insert(arg.begin(), '"');
    arg += '"';
  }
}

template <>
void maybe_quote_arg<wchar_t>(std::wstring& arg) {
  auto it = arg.find_first_of(L" \t\""); // contains space or double quotes?
  if(it != arg.npos) {
    // double existing quotes
    common::string_replace_all<wchar_t>(arg, L"\"", L"\"\"");
    // surround with quotes
    arg.insert(arg.begin(), L'"');
    arg += L'"';
  }
}

std::vector<std::filesystem::path>
get_sys_paths() {
  std::vector<std::filesystem::path> out;

  DWORD size = GetEnvironmentVariableW(L"PATH", nullptr, 0);
  if (size == 0) {
    return out;
  }

  std::wstring value(size, L'\0');
  size = GetEnvironmentVariableW(L"PATH", value.data(), size);
  value.resize(size);

  size_t start = 0;
  for (;;) {
    auto next = value.find(L';', start);
    auto entry = value.substr(start, next == std::wstring::npos ? std::wstring::npos : next - start);
    if (!entry.empty()) {
      out.push_back(std::filesystem::path(entry));
    }
    if (next == std::wstring::npos) {
      break;
    }
    start = next + 1;
  }

  return out;
}

Process::FileHandle::~FileHandle() {
  ::CloseHandle(fd_);
}

bool Process::FileHandle::read(void *buf, size_t size, size_t &got) noexcept {
  DWORD n;
  BOOL bSuccess = ::ReadFile(fd_, static_cast<CHAR*>(buf), static_cast<DWORD>(size), &n, nullptr);
  if(!bSuccess || n == 0) {
    return false;
  }

  got = static_cast<size_t>(n);
  return true;
}

// Simple HANDLE wrapper to close it automatically from the destructor.
class Handle {
public:
  Handle() noexcept : handle(INVALID_HANDLE_VALUE) { }
  ~Handle() noexcept {
    close();
  }
  void close() noexcept {
    if (handle != INVALID_HANDLE_VALUE)
      CloseHandle(handle);
  }
  HANDLE detach() noexcept {
    HANDLE old_handle = handle;
    handle = INVALID_HANDLE_VALUE;
    return old_handle;
  }
  operator HANDLE() const noexcept { return handle; }
  HANDLE* operator&() noexcept { return &handle; }
private:
  HANDLE handle;
};

//Based on the discussion thread: https://www.reddit.com/r/cpp/comments/3vpjqg/a_new_platform_independent_process_library_for_c11/cxq1wsj
std::mutex create_process_mutex;

//Based on the example at https://msdn.microsoft.com/en-us/library/windows/desktop/ms682499(v=vs.85).aspx.
bool Process::open(
    const std::filesystem::path &program,
    const std::vector<std::string> &args,
    const std::filesystem::path &workDir,
    bool redirect_output) noexcept {
  Handle stdout_rd_p;
  Handle stdout_wr_p;

  Handle stderr_rd_p;
  Handle stderr_wr_p;

  SECURITY_ATTRIBUTES security_attributes;

  security_attributes.nLength = sizeof(SECURITY_ATTRIBUTES);
  security_attributes.bInheritHandle = TRUE;
  security_attributes.lpSecurityDescriptor = nullptr;

  std::lock_guard<std::mutex> lock(create_process_mutex);

  if(redirect_output) {
    if (!CreatePipe(&stdout_rd_p, &stdout_wr_p, &security_attributes, 0) ||
        !SetHandleInformation(stdout_rd_p, HANDLE_FLAG_INHERIT, 0) ||
        !CreatePipe(&stderr_rd_p, &stderr_wr_p, &security_attributes, 0) ||
        !SetHandleInformation(stderr_rd_p, HANDLE_FLAG_INHERIT, 0)) {
      spawnError_ = static_cast<int>(GetLastError());
      return false;
    }
  }

  PROCESS_INFORMATION process_info;
  STARTUPINFOW startup_info;

  ZeroMemory(&process_info, sizeof(PROCESS_INFORMATION));

  ZeroMemory(&startup_info, sizeof(STARTUPINFO));
  startup_info.cb = sizeof(STARTUPINFO);
  if (redirect_output) {
    startup_info.hStdOutput = stdout_wr_p;
    startup_info.hStdError = stderr_wr_p;
    startup_info.dwFlags |= STARTF_USESTDHANDLES;
  }

  std::vector<std::wstring> wargs;
  wargs.push_back(program.wstring());
  for (auto &arg : args) {
    wargs.push_back(std::filesystem::path(arg).wstring());
  }

  auto cmdline = build_args(std::move(wargs));

  DWORD flags = CREATE_NO_WINDOW;
  if (!redirect_output) {
    flags |= DETACHED_PROCESS;
    flags &= ~CREATE_NO_WINDOW;
  }

  BOOL bSuccess = CreateProcessW(
      program.c_str(),
      (LPWSTR)cmdline.c_str(),
      nullptr,
      nullptr,
      redirect_output ? TRUE : FALSE,
      flags,
      nullptr,
      workDir.empty() ? nullptr : workDir.c_str(),
      &startup_info,
      &process_info);

  if(!bSuccess) {
    spawnError_ = static_cast<int>(GetLastError());
    return false;
  }

  CloseHandle(process_info.hThread);

  if(redirect_output) {
    stdoutFd_ = std::make_unique<FileHandle>(stdout_rd_p.detach());
    stderrFd_ = std::make_unique<FileHandle>(stderr_rd_p.detach());
  }

  dwProcessId_ = process_info.dwProcessId;
  procHandle_ = process_info.hProcess;

  return true;
}

//Based on http://stackoverflow.com/a/1173396
void Process::kill() noexcept {
  std::lock_guard<std::mutex> lock(close_mutex);
  if(dwProcessId_ > 0 && !closed_) {
    HANDLE snapshot = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
    if(snapshot) {
      PROCESSENTRY32 process;
      ZeroMemory(&process, sizeof(process));
      process.dwSize = sizeof(process);
      if(Process32First(snapshot, &process)) {
        do {
          if (process.th32ParentProcessID == dwProcessId_) {
            HANDLE process_handle = OpenProcess(PROCESS_TERMINATE, FALSE, process.th32ProcessID);
            if(process_handle) {
              TerminateProcess(process_handle, 2);
              CloseHandle(process_handle);
            }
          }
        } while (Process32Next(snapshot, &process));
      }
      CloseHandle(snapshot);
    }
    TerminateProcess(procHandle_, 2);
  }
}

int Process::wait() noexcept {
  if(dwProcessId_ == 0 || procHandle_ == nullptr)
    return -1;

  DWORD exit_status;
  WaitForSingleObject(procHandle_, INFINITE);
  if(!GetExitCodeProcess(procHandle_, &exit_status))
    exit_status = -1;

  closeHandles();

  return static_cast<int>(exit_status);
}

bool Process::wait(int &status, long ms) noexcept {
  if(dwProcessId_ == 0 || procHandle_ == nullptr)
    return false;

  DWORD wait_status = WaitForSingleObject(procHandle_, ms);

  if (wait_status == WAIT_TIMEOUT)
    return false;

  DWORD exit_status_win;
  if(!GetExitCodeProcess(procHandle_, &exit_status_win))
    exit_status_win = -1;

  closeHandles();

  status = static_cast<int>(exit_status_win);
  return true;
}

void Process::closeProcessHandle() noexcept {
  if (procHandle_) {
    ::CloseHandle(procHandle_);
    procHandle_ = nullptr;
  }
}

} // namespace process_lib
