#include "backupscheduler.h"
#include <QDebug>

BackupScheduler::BackupScheduler(qint64 intervalMs, QObject *parent)
    : QObject(parent)
{
    m_timer.setInterval(std::chrono::milliseconds(intervalMs));
    m_timer.setTimerType(Qt::CoarseTimer);
    m_initialTimer.setSingleShot(true);

    connect(&m_timer, &QTimer::timeout, this, &BackupScheduler::onTick);
    connect(&m_initialTimer, &QTimer::timeout, this, &BackupScheduler::onInitialDelayElapsed);
}

void BackupScheduler::beginRestore()
{
    if (m_state == State::Uninitialized || m_state == State::Idle) {
        setState(State::Restoring);
    }
}

void BackupScheduler::endRestore()
{
    if (m_state == State::Restoring) {
        setState(State::Idle);
    }
}

void BackupScheduler::start(bool initialBackup, qint64 initialDelayMs)
{
    if (m_state == State::Stopped) {
        qDebug() << "Backup scheduler already stopped, not starting";
        return;
    }

    if (m_timer.isActive() || m_initialTimer.isActive()) {
        return;
    }

    if (m_state == State::Uninitialized || m_state == State::Restoring) {
        setState(State::Idle);
    }

    if (initialBackup) {
        m_armAfterBackup = true;
        m_initialTimer.start(std::chrono::milliseconds(qMax<qint64>(0, initialDelayMs)));
        qDebug() << "First backup in" << initialDelayMs << "ms";
    } else {
        armTimer();
    }
}

bool BackupScheduler::requestBackup(bool notify)
{
    if (m_state != State::Idle && m_state != State::Uninitialized) {
        return false;
    }

    setState(State::BackingUp);
    emit backupRequested(notify);
    return true;
}

void BackupScheduler::backupFinished()
{
    if (m_state != State::BackingUp) {
        return;
    }

    setState(State::Idle);

    if (m_notifyPending) {
        // The first backup is still owed its notification
        m_notifyPending = false;
        requestBackup(true);
        return;
    }

    if (m_armAfterBackup) {
        m_armAfterBackup = false;
        armTimer();
    }
}

void BackupScheduler::stop()
{
    m_timer.stop();
    m_initialTimer.stop();
    m_armAfterBackup = false;
    m_notifyPending = false;

    if (m_state != State::Stopped) {
        setState(State::Stopped);
        qDebug() << "Backup scheduler stopped";
    }
}

BackupScheduler::State BackupScheduler::state() const
{
    return m_state;
}

bool BackupScheduler::isArmed() const
{
    return m_timer.isActive();
}

bool BackupScheduler::isBusy() const
{
    return m_state == State::BackingUp;
}

qint64 BackupScheduler::interval() const
{
    return m_timer.intervalAsDuration().count();
}

int BackupScheduler::skippedTicks() const
{
    return m_skippedTicks;
}

void BackupScheduler::onTick()
{
    if (m_state == State::BackingUp) {
        ++m_skippedTicks;
        qDebug() << "Previous backup still running, skipping tick";
        return;
    }

    requestBackup(false);
}

void BackupScheduler::onInitialDelayElapsed()
{
    if (!requestBackup(true) && m_state == State::BackingUp) {
        qDebug() << "Backup already running, first backup follows it";
        m_notifyPending = true;
    }
}

void BackupScheduler::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

void BackupScheduler::armTimer()
{
    if (m_state == State::Stopped) {
        return;
    }
    m_timer.start();
    qDebug() << "Backing up every" << interval() << "ms";
}
