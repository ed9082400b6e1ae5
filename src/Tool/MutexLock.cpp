#include "Tool/MutexLock.hpp"

#include <pthread.h>
#include <cerrno>
#include <system_error>

// pthread 返回的是错误码而不是设置 errno
static void throw_system_error(int ec, const char* what) {
    throw std::system_error(std::error_code(ec, std::generic_category()), what);
}

static int toPthreadProtocol(MutexLock::Protocol protocol) {
    switch (protocol) {
        case MutexLock::Protocol::PriorityInherit:
            return PTHREAD_PRIO_INHERIT;
        case MutexLock::Protocol::None:
        default:
            return PTHREAD_PRIO_NONE;
    }
}

MutexLock::MutexLock(Protocol protocol)
    : protocol_(protocol) {
    pthread_mutexattr_t attr{};
    int rc = pthread_mutexattr_init(&attr);
    if (rc != 0) {
        throw_system_error(rc, "pthread_mutexattr_init failed");
    }

    rc = pthread_mutexattr_setprotocol(&attr, toPthreadProtocol(protocol));
    if (rc != 0) {
        pthread_mutexattr_destroy(&attr);
        throw_system_error(rc, "pthread_mutexattr_setprotocol failed");
    }

    rc = pthread_mutexattr_setrobust(&attr, PTHREAD_MUTEX_ROBUST);
    if (rc != 0) {
        pthread_mutexattr_destroy(&attr);
        throw_system_error(rc, "pthread_mutexattr_setrobust(PTHREAD_MUTEX_ROBUST) failed");
    }

    rc = pthread_mutex_init(&mtx_, &attr);
    pthread_mutexattr_destroy(&attr);

    if (rc != 0)
        throw_system_error(rc, "pthread_mutex_init failed");
}

MutexLock::~MutexLock() {
    pthread_mutex_destroy(&mtx_);
}

void MutexLock::lock() const {
    int rc = pthread_mutex_lock(&mtx_);
    if (rc == 0) {
        recovered_ = false;
        return;
    }

    if (rc == EOWNERDEAD) {
        // 持有者线程退出时没有解锁：标记一致后视为成功
        int rc2 = pthread_mutex_consistent(&mtx_);
        if (rc2 != 0) {
            throw_system_error(rc2, "pthread_mutex_consistent failed");
        }
        recovered_ = true;
        return;
    }

    if (rc == ENOTRECOVERABLE) {
        throw_system_error(rc, "pthread_mutex_lock: mutex is not recoverable");
    }

    throw_system_error(rc, "pthread_mutex_lock failed");
}

bool MutexLock::try_lock() const noexcept {
    int rc = pthread_mutex_trylock(&mtx_);
    if (rc == 0) {
        recovered_ = false;
        return true;
    }

    if (rc == EBUSY) return false;

    if (rc == EOWNERDEAD) {
        if (pthread_mutex_consistent(&mtx_) == 0) {
            recovered_ = true;
            return true;
        }
        pthread_mutex_unlock(&mtx_);
        return false;
    }

    // ENOTRECOVERABLE / EINVAL 等：noexcept 环境下按失败处理
    return false;
}

void MutexLock::unlock() const noexcept {
    (void)pthread_mutex_unlock(&mtx_);
}
