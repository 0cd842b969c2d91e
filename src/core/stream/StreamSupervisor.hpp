#pragma once

#include "AudioFormat.hpp"
#include "DecoderCommand.hpp"
#include <QByteArray>
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>
#include <sys/types.h>

namespace hrb {

/// Lifecycle of one tag as seen by the supervisor.
/// Idle -> Starting -> Running -> Idle (stopped) or Restarting (decoder died)
enum class SessionState {
    Idle,
    Starting,
    Running,
    Restarting
};

const char* sessionStateName(SessionState state);

struct PollResult {
    enum Kind {
        Data,
        Eof,
        NoDataYet
    };

    Kind kind = NoDataYet;
    QByteArray bytes;
};

/// Read-only view of a running session.
struct SessionInfo {
    QString tag;
    QString url;
    pid_t pid = -1;
    SessionState state = SessionState::Idle;
    qint64 startedAtMs = 0;
    qint64 bytesRead = 0;
    qint64 fullChunks = 0;
    qint64 partialReads = 0;
};

/// Owns one external decoder process per tag and the read end of the pipe
/// carrying its PCM output.
///
/// Single-threaded: every call must come from the loop thread. No call
/// blocks longer than pollWaitMs, except stop() which may wait up to the
/// stop grace period for the decoder to exit.
class StreamSupervisor {
public:
    static constexpr int DEFAULT_POLL_WAIT_MS = 10;
    static constexpr int DEFAULT_STOP_GRACE_MS = 2000;

    explicit StreamSupervisor(DecoderCommand command = {},
                              AudioFormat format = {},
                              int pollWaitMs = DEFAULT_POLL_WAIT_MS,
                              int stopGraceMs = DEFAULT_STOP_GRACE_MS,
                              bool showDecoderOutput = false);
    ~StreamSupervisor();

    StreamSupervisor(const StreamSupervisor&) = delete;
    StreamSupervisor& operator=(const StreamSupervisor&) = delete;

    /// Launch a decoder for url under tag. Already running: no-op, true.
    /// On failure nothing is left behind and false is returned.
    bool start(const QString& tag, const QString& url);

    /// One bounded, non-blocking read of at most min(maxBytes, chunk size).
    /// Eof means the session has been torn down (decoder exited, closed its
    /// output, or the read failed); the tag is then Restarting.
    /// Unknown tag: Eof without side effects.
    PollResult poll(const QString& tag, int maxBytes);

    /// Terminate and reap the decoder, close the pipe. Idempotent; unknown
    /// tag is a no-op.
    void stop(const QString& tag);
    void stopAll();

    bool isRunning(const QString& tag) const { return sessions_.contains(tag); }
    SessionState state(const QString& tag) const;
    QStringList runningTags() const { return sessions_.keys(); }
    QList<SessionInfo> sessions() const;

    const AudioFormat& format() const { return format_; }
    int chunkSizeBytes() const { return format_.chunkSizeBytes(); }

private:
    struct Session {
        SessionInfo info;
        int readFd = -1;
    };

    bool spawn(const QString& url, int writeFd, pid_t& pid) const;
    void terminate(Session& session) const;
    void teardown(const QString& tag, const char* reason);

    DecoderCommand command_;
    AudioFormat format_;
    int pollWaitMs_;
    int stopGraceMs_;
    bool showOutput_;

    QHash<QString, Session> sessions_;
    QSet<QString> restarting_;
};

} // namespace hrb
