#include "StreamSupervisor.hpp"
#include <QDateTime>
#include <QElapsedTimer>
#include <QThread>
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace hrb {

namespace {

constexpr int kReapPollMs = 20;

void closeFd(int& fd)
{
    if (fd < 0) return;
    if (::close(fd) < 0 && errno != EINTR) {
        BOOST_LOG_TRIVIAL(warning) << "[StreamSupervisor] close(" << fd << ") failed: "
                                   << strerror(errno);
    }
    fd = -1;
}

void logExitStatus(const QString& tag, int status)
{
    if (WIFEXITED(status)) {
        BOOST_LOG_TRIVIAL(warning) << "[StreamSupervisor] Decoder for " << tag.toStdString()
                                   << " exited with code " << WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        BOOST_LOG_TRIVIAL(warning) << "[StreamSupervisor] Decoder for " << tag.toStdString()
                                   << " killed by signal " << WTERMSIG(status);
    }
}

} // namespace

const char* sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle: return "idle";
    case SessionState::Starting: return "starting";
    case SessionState::Running: return "running";
    case SessionState::Restarting: return "restarting";
    }
    return "unknown";
}

StreamSupervisor::StreamSupervisor(DecoderCommand command, AudioFormat format,
                                   int pollWaitMs, int stopGraceMs, bool showDecoderOutput)
    : command_(std::move(command))
    , format_(std::move(format))
    , pollWaitMs_(qMax(0, pollWaitMs))
    , stopGraceMs_(qMax(0, stopGraceMs))
    , showOutput_(showDecoderOutput)
{
}

StreamSupervisor::~StreamSupervisor()
{
    stopAll();
}

bool StreamSupervisor::spawn(const QString& url, int writeFd, pid_t& pid) const
{
    std::vector<std::string> storage;
    storage.push_back(command_.program.toStdString());
    for (const auto& arg : command_.expand(url, format_))
        storage.push_back(arg.toStdString());

    std::vector<char*> argv;
    argv.reserve(storage.size() + 1);
    for (auto& s : storage)
        argv.push_back(&s[0]);
    argv.push_back(nullptr);

    BOOST_LOG_TRIVIAL(debug) << "[StreamSupervisor] Spawning " << storage.front()
                             << " with " << (storage.size() - 1) << " argument(s)";

    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    posix_spawn_file_actions_init(&actions);
    posix_spawnattr_init(&attr);

    // PCM goes to the child's stdout; dup2 clears O_CLOEXEC on the copy
    posix_spawn_file_actions_adddup2(&actions, writeFd, STDOUT_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (!showOutput_)
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    // Own process group so stop() can signal the decoder and anything it forks
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK
                                        | POSIX_SPAWN_SETSIGDEF);
    posix_spawnattr_setpgroup(&attr, 0);
    sigset_t empty;
    sigemptyset(&empty);
    posix_spawnattr_setsigmask(&attr, &empty);
    // The bridge ignores SIGPIPE; decoders get the default back
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaults);

    const int rc = posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);

    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        BOOST_LOG_TRIVIAL(error) << "[StreamSupervisor] Cannot launch " << storage.front()
                                 << ": " << strerror(rc);
        pid = -1;
        return false;
    }
    return true;
}

bool StreamSupervisor::start(const QString& tag, const QString& url)
{
    if (sessions_.contains(tag)) {
        BOOST_LOG_TRIVIAL(debug) << "[StreamSupervisor] " << tag.toStdString() << " already running";
        return true;
    }

    Session session;
    session.info.tag = tag;
    session.info.url = url;
    session.info.state = SessionState::Starting;

    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        BOOST_LOG_TRIVIAL(error) << "[StreamSupervisor] pipe2 failed for " << tag.toStdString()
                                 << ": " << strerror(errno);
        return false;
    }
    int readFd = fds[0];
    int writeFd = fds[1];

    pid_t pid = -1;
    const bool launched = spawn(url, writeFd, pid);
    // The child holds its own copy now; ours would keep the pipe open past EOF
    closeFd(writeFd);

    if (!launched) {
        closeFd(readFd);
        return false;
    }

    const int flags = ::fcntl(readFd, F_GETFL);
    if (flags < 0 || ::fcntl(readFd, F_SETFL, flags | O_NONBLOCK) < 0) {
        BOOST_LOG_TRIVIAL(error) << "[StreamSupervisor] Cannot make pipe non-blocking for "
                                 << tag.toStdString() << ": " << strerror(errno);
        session.info.pid = pid;
        session.readFd = readFd;
        terminate(session);
        closeFd(session.readFd);
        return false;
    }

    session.readFd = readFd;
    session.info.pid = pid;
    session.info.state = SessionState::Running;
    session.info.startedAtMs = QDateTime::currentMSecsSinceEpoch();

    sessions_.insert(tag, session);
    restarting_.remove(tag);

    BOOST_LOG_TRIVIAL(info) << "[StreamSupervisor] Started " << tag.toStdString()
                            << " (pid " << pid << ")";
    return true;
}

PollResult StreamSupervisor::poll(const QString& tag, int maxBytes)
{
    PollResult result;

    auto it = sessions_.find(tag);
    if (it == sessions_.end()) {
        result.kind = PollResult::Eof;
        return result;
    }
    Session& session = it.value();

    // A decoder that has exited ends the session even if something it left
    // behind still holds the pipe open
    int status = 0;
    const pid_t pid = session.info.pid;
    if (::waitpid(pid, &status, WNOHANG) == pid) {
        logExitStatus(tag, status);
        if (::kill(-pid, SIGKILL) < 0 && errno != ESRCH) {
            BOOST_LOG_TRIVIAL(warning) << "[StreamSupervisor] SIGKILL to leftover group " << pid
                                       << " failed: " << strerror(errno);
        }
        session.info.pid = -1;
        teardown(tag, "decoder exited");
        result.kind = PollResult::Eof;
        return result;
    }

    pollfd pfd{};
    pfd.fd = session.readFd;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, pollWaitMs_);
    if (ready < 0) {
        if (errno == EINTR) return result;
        BOOST_LOG_TRIVIAL(error) << "[StreamSupervisor] poll failed for " << tag.toStdString()
                                 << ": " << strerror(errno);
        teardown(tag, "poll error");
        result.kind = PollResult::Eof;
        return result;
    }
    if (ready == 0 || !(pfd.revents & (POLLIN | POLLHUP | POLLERR)))
        return result;

    const int cap = qMax(0, qMin(maxBytes, format_.chunkSizeBytes()));
    if (cap == 0) return result;

    QByteArray buffer(cap, Qt::Uninitialized);
    const ssize_t n = ::read(session.readFd, buffer.data(), static_cast<size_t>(cap));
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return result;
        BOOST_LOG_TRIVIAL(error) << "[StreamSupervisor] read failed for " << tag.toStdString()
                                 << ": " << strerror(errno);
        teardown(tag, "read error");
        result.kind = PollResult::Eof;
        return result;
    }
    if (n == 0) {
        teardown(tag, "decoder closed its output");
        result.kind = PollResult::Eof;
        return result;
    }

    buffer.resize(static_cast<int>(n));
    session.info.bytesRead += n;
    if (n == format_.chunkSizeBytes())
        ++session.info.fullChunks;
    else
        ++session.info.partialReads;

    result.kind = PollResult::Data;
    result.bytes = buffer;
    return result;
}

void StreamSupervisor::terminate(Session& session) const
{
    const pid_t pid = session.info.pid;
    if (pid <= 0) return;

    if (::kill(-pid, SIGTERM) < 0 && errno != ESRCH) {
        BOOST_LOG_TRIVIAL(warning) << "[StreamSupervisor] SIGTERM to group " << pid
                                   << " failed: " << strerror(errno);
    }

    QElapsedTimer clock;
    clock.start();
    int status = 0;
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno == ECHILD)) {
            session.info.pid = -1;
            return;
        }
        if (clock.elapsed() >= stopGraceMs_) break;
        QThread::msleep(kReapPollMs);
    }

    BOOST_LOG_TRIVIAL(warning) << "[StreamSupervisor] Decoder " << pid << " ignored SIGTERM for "
                               << stopGraceMs_ << " ms, killing";
    ::kill(-pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    session.info.pid = -1;
}

void StreamSupervisor::teardown(const QString& tag, const char* reason)
{
    auto it = sessions_.find(tag);
    if (it == sessions_.end()) return;

    Session session = it.value();
    sessions_.erase(it);

    terminate(session);
    closeFd(session.readFd);
    restarting_.insert(tag);

    BOOST_LOG_TRIVIAL(warning) << "[StreamSupervisor] " << tag.toStdString() << " ended: " << reason
                               << " (" << session.info.bytesRead << " bytes, "
                               << session.info.partialReads << " partial reads)";
}

void StreamSupervisor::stop(const QString& tag)
{
    restarting_.remove(tag);

    auto it = sessions_.find(tag);
    if (it == sessions_.end()) return;

    Session session = it.value();
    sessions_.erase(it);

    terminate(session);
    closeFd(session.readFd);

    BOOST_LOG_TRIVIAL(info) << "[StreamSupervisor] Stopped " << tag.toStdString();
}

void StreamSupervisor::stopAll()
{
    const QStringList tags = sessions_.keys();
    for (const auto& tag : tags)
        stop(tag);
    restarting_.clear();
}

SessionState StreamSupervisor::state(const QString& tag) const
{
    auto it = sessions_.constFind(tag);
    if (it != sessions_.cend()) return it->info.state;
    if (restarting_.contains(tag)) return SessionState::Restarting;
    return SessionState::Idle;
}

QList<SessionInfo> StreamSupervisor::sessions() const
{
    QList<SessionInfo> out;
    for (const auto& session : sessions_)
        out.append(session.info);
    return out;
}

} // namespace hrb
