#ifndef BACKUPSCHEDULER_H
#define BACKUPSCHEDULER_H

#include <QObject>
#include <QTimer>

// Decides when a backup cycle runs. It never runs one itself: it emits
// backupRequested() and waits for backupFinished(), so two cycles can
// never overlap. Ticks that arrive while a cycle is running are dropped.
class BackupScheduler : public QObject {
    Q_OBJECT

public:
    enum class State {
        Uninitialized,
        Restoring,
        Idle,
        BackingUp,
        Stopped
    };
    Q_ENUM(State)

    explicit BackupScheduler(qint64 intervalMs, QObject *parent = nullptr);

    void beginRestore();
    void endRestore();

    // Arms the recurring timer. With initialBackup set, one notifying backup
    // runs after initialDelayMs first and the timer is armed once it is done.
    void start(bool initialBackup, qint64 initialDelayMs = 0);

    // Returns false when a cycle is already running or the scheduler is
    // stopped or restoring.
    bool requestBackup(bool notify = false);
    void backupFinished();

    // Idempotent. A cycle already running is allowed to finish.
    void stop();

    State state() const;
    bool isArmed() const;
    bool isBusy() const;
    qint64 interval() const;
    int skippedTicks() const;

signals:
    void backupRequested(bool notify);
    void stateChanged(BackupScheduler::State state);

private slots:
    void onTick();
    void onInitialDelayElapsed();

private:
    void setState(State state);
    void armTimer();

    QTimer m_timer;
    QTimer m_initialTimer;
    State m_state = State::Uninitialized;
    bool m_armAfterBackup = false;
    bool m_notifyPending = false;
    int m_skippedTicks = 0;
};

#endif // BACKUPSCHEDULER_H
