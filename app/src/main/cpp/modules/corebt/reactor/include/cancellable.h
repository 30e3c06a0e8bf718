#ifndef CANCELLABLE_H
#define CANCELLABLE_H

/**
 * Handle to something that can be stopped from another thread:
 * a pending timer, an event-bus subscription, a background worker.
 * cancel() must be safe to call repeatedly and after completion.
 */
class Cancellable {
public:
    virtual ~Cancellable() = default;
    virtual void cancel() = 0;
    virtual bool isCancelled() const = 0;

    // Still able to do work: not cancelled and not finished.
    virtual bool isActive() const { return !isCancelled(); }
};

#endif // CANCELLABLE_H
