#ifndef RELAY_SUBPROCESS_PROCESS_HPP
#define RELAY_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay
{
namespace subprocess
{

// Forward declarations for platform-specific types
struct ProcessHandle;
struct PipeHandle;
class WritePipe;

// Pipe for reading from subprocess
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    // No copy, move only
    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    // Read up to size bytes, returns actual bytes read
    // Returns 0 on EOF, throws on error
    size_t read(char* buffer, size_t size);

    // Read until EOF
    std::string read_all();

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    friend int wait_ready(ReadPipe*, ReadPipe*, WritePipe*, int);
    std::unique_ptr<PipeHandle> handle_;
};

// Pipe for writing to subprocess
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    // No copy, move only
    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    // Write data to pipe. In non-blocking mode returns 0 when the pipe is full.
    size_t write(const char* data, size_t size);

    // Write the whole buffer (blocking mode only)
    void write_all(const std::string& data);

    // Make write() return instead of blocking on a full pipe
    void set_nonblocking();

    // Close the pipe
    void close();

    // Check if pipe is open
    bool is_open() const;

  private:
    friend class Process;
    friend int wait_ready(ReadPipe*, ReadPipe*, WritePipe*, int);
    std::unique_ptr<PipeHandle> handle_;
};

// Process configuration
struct ProcessOptions
{
    std::map<std::string, std::string> environment; // Overrides on top of the inherited env
    bool redirect_stdin = true;                      // If false, the child reads from /dev/null
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

// Main Process class
class Process
{
  public:
    Process();
    ~Process();

    // No copy, move only
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    // Spawn a process. Throws std::runtime_error if the executable cannot be
    // started (the exec errno is reported back from the child).
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    // Get pipes (only valid if redirected)
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    // Process control
    std::optional<int> try_wait(); // Non-blocking wait, returns exit code if done
    int wait();                    // Blocking wait, returns exit code
    void kill();                   // Forceful kill (SIGKILL)

    // Process ID
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

// Ready bits returned by wait_ready
constexpr int READY_FIRST = 1;
constexpr int READY_SECOND = 2;
constexpr int READY_INPUT = 4;

// Wait until a read pipe is readable (data or EOF) or the write pipe is
// writable. Null or closed pipes are ignored. Returns a mask of READY_* bits,
// 0 on timeout.
int wait_ready(ReadPipe* first, ReadPipe* second, WritePipe* input, int timeout_ms);

// Resolve an executable name against a colon-separated search path.
// Names containing '/' are checked as given.
std::optional<std::string> find_executable(const std::string& name,
                                           const std::string& search_path);

} // namespace subprocess
} // namespace relay

#endif // RELAY_SUBPROCESS_PROCESS_HPP
