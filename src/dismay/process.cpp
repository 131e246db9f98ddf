#include <dismay/process.hpp>

#include <cerrno>

#include <array>
#include <iterator>
#include <system_error>
#include <utility>

#include <boost/predef.h>

#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace dismay
{
namespace
{
auto last_system_error() noexcept -> std::error_code
{
    return {errno, std::system_category()};
}

class file_descriptor
{
public:
    file_descriptor() noexcept = default;
    explicit file_descriptor(int fd) noexcept
        : mFd(fd)
    {
    }
    file_descriptor(file_descriptor &&other) noexcept
        : mFd(std::exchange(other.mFd, -1))
    {
    }
    auto operator=(file_descriptor &&other) noexcept -> file_descriptor &
    {
        reset();
        mFd = std::exchange(other.mFd, -1);
        return *this;
    }
    ~file_descriptor() noexcept
    {
        reset();
    }

    [[nodiscard]] auto get() const noexcept -> int
    {
        return mFd;
    }

    void reset() noexcept
    {
        if (mFd >= 0)
        {
            ::close(mFd);
            mFd = -1;
        }
    }

private:
    int mFd{-1};
};

struct pipe_pair
{
    file_descriptor read_end;
    file_descriptor write_end;
};

auto make_pipe() -> result<pipe_pair>
{
    std::array<int, 2> fds{-1, -1};
    if (::pipe(fds.data()) != 0)
    {
        return last_system_error();
    }
    return pipe_pair{file_descriptor(fds[0]), file_descriptor(fds[1])};
}

class spawn_actions
{
public:
    spawn_actions() noexcept
    {
        ::posix_spawn_file_actions_init(&mActions);
    }
    ~spawn_actions() noexcept
    {
        ::posix_spawn_file_actions_destroy(&mActions);
    }
    spawn_actions(spawn_actions const &) = delete;
    auto operator=(spawn_actions const &) -> spawn_actions & = delete;

    auto redirect(file_descriptor const &from, int to) -> result<void>
    {
        if (int const rc
            = ::posix_spawn_file_actions_adddup2(&mActions, from.get(), to);
            rc != 0)
        {
            return std::error_code(rc, std::system_category());
        }
        return success();
    }
    auto close(file_descriptor const &fd) -> result<void>
    {
        if (int const rc
            = ::posix_spawn_file_actions_addclose(&mActions, fd.get());
            rc != 0)
        {
            return std::error_code(rc, std::system_category());
        }
        return success();
    }
    auto chdir(std::filesystem::path const &dir) -> result<void>
    {
#if defined BOOST_OS_LINUX_AVAILABLE
        if (int const rc = ::posix_spawn_file_actions_addchdir_np(
                    &mActions, dir.c_str());
            rc != 0)
        {
            return std::error_code(rc, std::system_category());
        }
        return success();
#else
        (void)dir;
        return errc::not_supported;
#endif
    }

    [[nodiscard]] auto get() const noexcept
            -> posix_spawn_file_actions_t const *
    {
        return &mActions;
    }

private:
    posix_spawn_file_actions_t mActions{};
};

struct captured_streams
{
    file_descriptor out;
    file_descriptor err;
};

auto spawn(command const &cmd,
           spawn_actions const &actions) -> result<pid_t>
{
    std::vector<char *> argv;
    argv.reserve(cmd.arguments().size() + 2);
    // posix_spawnp() takes mutable pointers but doesn't modify the strings
    argv.push_back(const_cast<char *>(cmd.program().c_str()));
    for (auto const &a : cmd.arguments())
    {
        argv.push_back(const_cast<char *>(a.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    if (int const rc = ::posix_spawnp(&pid, cmd.program().c_str(),
                                      actions.get(), nullptr, argv.data(),
                                      environ);
        rc != 0)
    {
        return std::error_code(rc, std::system_category());
    }
    return pid;
}

auto wait_for(pid_t pid) -> result<exit_status>
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            return last_system_error();
        }
    }
    return exit_status::from_wait_status(status);
}

// drains both pipes concurrently, a child blocked on a full stderr pipe
// would otherwise never close its stdout
auto drain(captured_streams streams,
           std::string &stdoutData,
           std::string &stderrData) -> result<void>
{
    std::array<char, 4096> chunk{};
    std::array<pollfd, 2> fds{
            pollfd{streams.out.get(), POLLIN, 0},
            pollfd{streams.err.get(), POLLIN, 0},
    };
    std::array<std::string *, 2> sinks{&stdoutData, &stderrData};

    int open = 2;
    while (open > 0)
    {
        if (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return last_system_error();
        }
        for (std::size_t i = 0; i < fds.size(); ++i)
        {
            if (fds[i].fd < 0 || fds[i].revents == 0)
            {
                continue;
            }
            auto const n = ::read(fds[i].fd, chunk.data(), chunk.size());
            if (n < 0 && errno == EINTR)
            {
                continue;
            }
            if (n < 0)
            {
                return last_system_error();
            }
            if (n == 0)
            {
                // negative descriptors are ignored by poll()
                fds[i].fd = -1;
                --open;
                continue;
            }
            sinks[i]->append(chunk.data(), static_cast<std::size_t>(n));
        }
    }
    return success();
}

auto spawn_failure(command const &cmd) -> auto
{
    return [&cmd](report &r)
    {
        r.wrap_err(fmt::format(FMT_STRING("{}: {}"),
                               make_error_code(errc::spawn_failed).message(),
                               cmd));
    };
}

} // namespace

auto exit_status::from_wait_status(int status) noexcept -> exit_status
{
    if (WIFEXITED(status))
    {
        return from_code(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status))
    {
        return from_signal(WTERMSIG(status));
    }
    return unknown();
}

command::command(std::string program)
    : mProgram(std::move(program))
    , mArguments()
    , mWorkingDirectory()
{
}

auto command::arg(std::string value) -> command &
{
    mArguments.push_back(std::move(value));
    return *this;
}

auto command::args(std::initializer_list<std::string_view> values)
        -> command &
{
    for (auto value : values)
    {
        mArguments.emplace_back(value);
    }
    return *this;
}

auto command::args(std::vector<std::string> const &values) -> command &
{
    mArguments.insert(mArguments.end(), values.begin(), values.end());
    return *this;
}

auto command::current_dir(std::filesystem::path dir) -> command &
{
    mWorkingDirectory = std::move(dir);
    return *this;
}

auto command::program() const noexcept -> std::string const &
{
    return mProgram;
}

auto command::arguments() const noexcept -> std::vector<std::string> const &
{
    return mArguments;
}

auto command::working_directory() const noexcept
        -> std::optional<std::filesystem::path> const &
{
    return mWorkingDirectory;
}

auto command::output() const -> result<process_output>
{
    spawn_actions actions;
    if (mWorkingDirectory.has_value())
    {
        DISMAY_TRY(inject(actions.chdir(*mWorkingDirectory),
                          spawn_failure(*this)));
    }

    DISMAY_TRY(outPipe, inject(make_pipe(), spawn_failure(*this)));
    DISMAY_TRY(errPipe, inject(make_pipe(), spawn_failure(*this)));
    DISMAY_TRY(inject(actions.redirect(outPipe.write_end, STDOUT_FILENO),
                      spawn_failure(*this)));
    DISMAY_TRY(inject(actions.redirect(errPipe.write_end, STDERR_FILENO),
                      spawn_failure(*this)));
    DISMAY_TRY(inject(actions.close(outPipe.read_end), spawn_failure(*this)));
    DISMAY_TRY(inject(actions.close(errPipe.read_end), spawn_failure(*this)));

    DISMAY_TRY(pid, inject(spawn(*this, actions), spawn_failure(*this)));

    // the child owns its copies of the write ends
    outPipe.write_end.reset();
    errPipe.write_end.reset();

    process_output out{exit_status::unknown(), {}, {}};
    auto drained = drain(
            captured_streams{std::move(outPipe.read_end),
                             std::move(errPipe.read_end)},
            out.stdout_data, out.stderr_data);

    // always reap the child, even if reading its output failed
    DISMAY_TRY(exitStatus, wait_for(pid));
    if (drained.has_error())
    {
        return std::move(drained).assume_error();
    }
    out.status = exitStatus;
    return out;
}

auto command::status() const -> result<exit_status>
{
    spawn_actions actions;
    if (mWorkingDirectory.has_value())
    {
        DISMAY_TRY(inject(actions.chdir(*mWorkingDirectory),
                          spawn_failure(*this)));
    }
    DISMAY_TRY(pid, inject(spawn(*this, actions), spawn_failure(*this)));
    return wait_for(pid);
}

} // namespace dismay

auto fmt::formatter<dismay::command>::format(dismay::command const &cmd,
                                             format_context &ctx) const
        -> format_context::iterator
{
    auto out = ctx.out();
    if (cmd.working_directory().has_value())
    {
        out = fmt::format_to(out, "cd {:?} && ",
                             cmd.working_directory()->string());
    }
    out = fmt::format_to(out, "{:?}", cmd.program());
    for (auto const &a : cmd.arguments())
    {
        out = fmt::format_to(out, " {:?}", a);
    }
    return out;
}
