#include <filesystem>
#include <fstream>
#include <random>
#include <relay/command.hpp>
#include <relay/errors.hpp>

namespace relay
{

std::size_t prompt_length(const std::string& text)
{
    std::size_t count = 0;
    for (unsigned char c : text)
    {
        // Continuation bytes (10xxxxxx) belong to the preceding code point
        if ((c & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

std::string write_prompt_temp_file(const std::string& contents,
                                   std::vector<std::string>& temp_files)
{
    namespace fs = std::filesystem;
    auto make_name = []
    {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<int> dist(0, 15);
        const char* digits = "0123456789abcdef";
        std::string hex(8, '0');
        for (auto& c : hex)
            c = digits[dist(gen)];
        return std::string("claude_system_prompt-") + hex + ".txt";
    };

    std::error_code ec;
    fs::path temp_dir = fs::temp_directory_path(ec);
    if (ec)
        throw RelayError("Cannot determine temp directory: " + ec.message());

    fs::path temp_file;
    constexpr int max_attempts = 10;
    for (int attempt = 0; attempt < max_attempts; ++attempt)
    {
        temp_file = temp_dir / make_name();

        // Never write through an existing path (it may be a planted symlink)
        if (fs::exists(fs::symlink_status(temp_file, ec)))
            continue;

        std::ofstream ofs(temp_file, std::ios::binary | std::ios::out | std::ios::trunc);
        if (!ofs)
            continue;

        if (fs::is_symlink(temp_file, ec))
        {
            ofs.close();
            fs::remove(temp_file, ec);
            throw RelayError("Symlink detected after temp file creation: " + temp_file.string());
        }

        ofs << contents;
        ofs.close();
        if (!ofs)
            throw RelayError("Failed to write system prompt to " + temp_file.string());

        temp_files.push_back(temp_file.string());
        return temp_file.string();
    }

    throw RelayError("Failed to create temp file for system prompt after " +
                     std::to_string(max_attempts) + " attempts");
}

Invocation build_invocation(const Request& request, const RelayConfig& config)
{
    Invocation invocation;
    auto& cmd = invocation.command;

    cmd.push_back(config.cli_path);

    if (request.print_mode)
        cmd.push_back("--print");

    if (request.model)
    {
        cmd.push_back("--model");
        cmd.push_back(*request.model);
    }

    // Session id wins over resume
    if (request.session_id)
    {
        cmd.push_back("--session-id");
        cmd.push_back(*request.session_id);
    }
    else if (request.resume_id)
    {
        cmd.push_back("--resume");
        cmd.push_back(*request.resume_id);
    }

    if (request.output_format)
    {
        cmd.push_back("--output-format");
        cmd.push_back(*request.output_format);
    }

    if (request.system_prompt)
    {
        cmd.push_back("--append-system-prompt");
        if (prompt_length(*request.system_prompt) > INLINE_PROMPT_LIMIT)
            cmd.push_back("@" + write_prompt_temp_file(*request.system_prompt,
                                                       invocation.temp_files));
        else
            cmd.push_back(*request.system_prompt);
    }

    if (request.user_prompt && prompt_length(*request.user_prompt) < INLINE_PROMPT_LIMIT)
        cmd.push_back(*request.user_prompt);
    else
        invocation.piped_input = request.user_prompt;

    return invocation;
}

} // namespace relay
