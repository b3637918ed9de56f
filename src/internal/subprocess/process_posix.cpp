// POSIX implementation of subprocess process management
// For Linux and macOS

#include "process.hpp"

#include <algorithm>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <filesystem>
#include <signal.h>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace relay
{
namespace subprocess
{

// ============================================================================
// ProcessHandle - POSIX implementation
// ============================================================================

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

// ============================================================================
// PipeHandle - POSIX implementation
// ============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

// ============================================================================
// Helper functions
// ============================================================================

static std::string get_errno_message(int err = errno)
{
    return std::strerror(err);
}

static void close_pair(int fds[2])
{
    if (fds[0] >= 0)
        ::close(fds[0]);
    if (fds[1] >= 0)
        ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

static int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Report errno to the parent over the status pipe and exit
[[noreturn]] static void child_fail(int status_fd)
{
    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

// ============================================================================
// ReadPipe implementation
// ============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_read;
    do
        bytes_read = ::read(handle_->fd, buffer, size);
    while (bytes_read < 0 && errno == EINTR);

    if (bytes_read < 0)
        throw std::runtime_error("Read failed: " + get_errno_message());

    return static_cast<size_t>(bytes_read);
}

std::string ReadPipe::read_all()
{
    std::string data;
    char buffer[8192];
    size_t n;
    while ((n = read(buffer, sizeof(buffer))) > 0)
        data.append(buffer, n);
    return data;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// WritePipe implementation
// ============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t bytes_written;
    do
        bytes_written = ::write(handle_->fd, data, size);
    while (bytes_written < 0 && errno == EINTR);

    if (bytes_written < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0; // Pipe full (non-blocking)
        if (errno == EPIPE)
            throw std::runtime_error("Broken pipe (process closed stdin)");
        throw std::runtime_error("Write failed: " + get_errno_message());
    }

    return static_cast<size_t>(bytes_written);
}

void WritePipe::write_all(const std::string& data)
{
    size_t offset = 0;
    while (offset < data.size())
        offset += write(data.data() + offset, data.size() - offset);
}

void WritePipe::set_nonblocking()
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    int flags = fcntl(handle_->fd, F_GETFL, 0);
    if (flags == -1)
        throw std::runtime_error("fcntl F_GETFL failed: " + get_errno_message());
    if (fcntl(handle_->fd, F_SETFL, flags | O_NONBLOCK) == -1)
        throw std::runtime_error("fcntl F_SETFL failed: " + get_errno_message());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// ============================================================================
// Process implementation
// ============================================================================

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    if (handle_ && handle_->running)
    {
        kill();
        wait();
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto cleanup = [&]()
    {
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
    };

    if (options.redirect_stdin && pipe(stdin_pipe) != 0)
    {
        cleanup();
        throw std::runtime_error("Failed to create stdin pipe: " + get_errno_message());
    }

    if (options.redirect_stdout && pipe(stdout_pipe) != 0)
    {
        int err = errno;
        cleanup();
        throw std::runtime_error("Failed to create stdout pipe: " + get_errno_message(err));
    }

    if (options.redirect_stderr && pipe(stderr_pipe) != 0)
    {
        int err = errno;
        cleanup();
        throw std::runtime_error("Failed to create stderr pipe: " + get_errno_message(err));
    }

    // Closed automatically by a successful exec; carries errno otherwise
    if (pipe2(status_pipe, O_CLOEXEC) != 0)
    {
        int err = errno;
        cleanup();
        throw std::runtime_error("Failed to create status pipe: " + get_errno_message(err));
    }

    // Everything the child needs is prepared before fork: only
    // async-signal-safe calls are allowed between fork and exec.
    std::vector<std::string> env_storage;
    for (char** entry = environ; entry && *entry; ++entry)
    {
        std::string kv(*entry);
        std::string key = kv.substr(0, kv.find('='));
        if (options.environment.find(key) == options.environment.end())
            env_storage.push_back(std::move(kv));
    }
    for (const auto& [key, value] : options.environment)
        env_storage.push_back(key + "=" + value);

    std::vector<char*> envp;
    for (auto& kv : env_storage)
        envp.push_back(kv.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    // Fork the process
    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        cleanup();
        throw std::runtime_error("Failed to fork process: " + get_errno_message(err));
    }

    if (pid == 0)
    {
        // Child process
        ::close(status_pipe[0]);
        int status_fd = status_pipe[1];

        if (options.redirect_stdin)
        {
            ::close(stdin_pipe[1]); // Close write end
            if (dup2(stdin_pipe[0], STDIN_FILENO) < 0)
                child_fail(status_fd);
            ::close(stdin_pipe[0]);
        }
        else
        {
            int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0)
                child_fail(status_fd);
            ::close(null_fd);
        }

        if (options.redirect_stdout)
        {
            ::close(stdout_pipe[0]); // Close read end
            if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0)
                child_fail(status_fd);
            ::close(stdout_pipe[1]);
        }

        if (options.redirect_stderr)
        {
            ::close(stderr_pipe[0]); // Close read end
            if (dup2(stderr_pipe[1], STDERR_FILENO) < 0)
                child_fail(status_fd);
            ::close(stderr_pipe[1]);
        }

        // Restore default SIGPIPE handling for the child
        signal(SIGPIPE, SIG_DFL);

        execvpe(executable.c_str(), argv.data(), envp.data());

        // If execvpe returns, it failed
        child_fail(status_fd);
    }

    // Parent process
    ::close(status_pipe[1]);
    status_pipe[1] = -1;

    int child_errno = 0;
    ssize_t n;
    do
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);
    status_pipe[0] = -1;

    if (n == static_cast<ssize_t>(sizeof(child_errno)))
    {
        // exec never happened; reap the child before reporting
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
        cleanup();
        throw std::runtime_error("Failed to execute " + executable + ": " +
                                 get_errno_message(child_errno));
    }

    if (options.redirect_stdin)
    {
        ::close(stdin_pipe[0]); // Close read end
        stdin_ = std::make_unique<WritePipe>();
        stdin_->handle_->fd = stdin_pipe[1];
    }

    if (options.redirect_stdout)
    {
        ::close(stdout_pipe[1]); // Close write end
        stdout_ = std::make_unique<ReadPipe>();
        stdout_->handle_->fd = stdout_pipe[0];
    }

    if (options.redirect_stderr)
    {
        ::close(stderr_pipe[1]); // Close write end
        stderr_ = std::make_unique<ReadPipe>();
        stderr_->handle_->fd = stderr_pipe[0];
    }

    // Store process information
    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw std::runtime_error("stdin not redirected");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw std::runtime_error("stdout not redirected");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw std::runtime_error("stderr not redirected");
    return *stderr_;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
        result = waitpid(handle_->pid, &status, WNOHANG);
    while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }
    else if (result == 0)
    {
        // Process is still running
        return std::nullopt;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0)
        return handle_ ? handle_->exit_code : -1;

    if (!handle_->running)
        return handle_->exit_code;

    int status;
    pid_t result;
    do
        result = waitpid(handle_->pid, &status, 0);
    while (result < 0 && errno == EINTR);

    if (result == handle_->pid)
    {
        handle_->exit_code = decode_wait_status(status);
        handle_->running = false;
        return handle_->exit_code;
    }

    throw std::runtime_error("waitpid failed: " + get_errno_message());
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

// ============================================================================
// Helper functions
// ============================================================================

int wait_ready(ReadPipe* first, ReadPipe* second, WritePipe* input, int timeout_ms)
{
    int first_fd = (first && first->is_open()) ? first->handle_->fd : -1;
    int second_fd = (second && second->is_open()) ? second->handle_->fd : -1;
    int input_fd = (input && input->is_open()) ? input->handle_->fd : -1;
    if (first_fd < 0 && second_fd < 0 && input_fd < 0)
        return 0;

    fd_set read_fds;
    fd_set write_fds;
    FD_ZERO(&read_fds);
    FD_ZERO(&write_fds);
    int max_fd = -1;
    for (int fd : {first_fd, second_fd})
    {
        if (fd >= 0)
        {
            FD_SET(fd, &read_fds);
            max_fd = std::max(max_fd, fd);
        }
    }
    if (input_fd >= 0)
    {
        FD_SET(input_fd, &write_fds);
        max_fd = std::max(max_fd, input_fd);
    }

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(max_fd + 1, &read_fds, &write_fds, nullptr, &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            return 0;
        throw std::runtime_error("select failed: " + get_errno_message());
    }

    int ready = 0;
    if (result > 0)
    {
        if (first_fd >= 0 && FD_ISSET(first_fd, &read_fds))
            ready |= READY_FIRST;
        if (second_fd >= 0 && FD_ISSET(second_fd, &read_fds))
            ready |= READY_SECOND;
        if (input_fd >= 0 && FD_ISSET(input_fd, &write_fds))
            ready |= READY_INPUT;
    }
    return ready;
}

std::optional<std::string> find_executable(const std::string& name,
                                           const std::string& search_path)
{
    namespace fs = std::filesystem;

    auto is_executable = [](const fs::path& path)
    {
        std::error_code ec;
        return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
    };

    // Absolute or relative path: check as given
    if (name.find('/') != std::string::npos)
    {
        if (!is_executable(name))
            return std::nullopt;
        fs::path exe_path(name);
        return exe_path.is_absolute() ? name : fs::absolute(exe_path).string();
    }

    // Split search path by colon
    size_t start = 0;
    while (start <= search_path.size())
    {
        size_t end = search_path.find(':', start);
        if (end == std::string::npos)
            end = search_path.size();

        std::string dir = search_path.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path test_path = fs::path(dir) / name;
            if (is_executable(test_path))
                return test_path.string();
        }

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace relay
