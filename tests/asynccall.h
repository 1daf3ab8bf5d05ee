// -*- mode: c++ -*-
#ifndef ASYNCCALL_H
#define ASYNCCALL_H
#include <QThread>
#include <exception>
#include <functional>

/** Runs a blocking host call on its own thread while the test plays the device. */
class AsyncCall : public QThread
{
public:
    explicit AsyncCall(const std::function<void()>& fn) : fn(fn) { start(); }
    ~AsyncCall() { wait(); }

    /** True when the call returned or threw within timeoutMs. */
    bool finish(int timeoutMs = 5000) { return wait(timeoutMs); }

    bool failed() const { return error != nullptr; }

    /** Rethrows what the call threw, if anything. */
    void rethrow() const
    {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    template <class E>
    bool threw() const
    {
        try {
            rethrow();
        } catch (const E&) {
            return true;
        } catch (...) {
            return false;
        }
        return false;
    }

protected:
    void run()
    {
        try {
            fn();
        } catch (...) {
            error = std::current_exception();
        }
    }

private:
    std::function<void()> fn;
    std::exception_ptr error;
};

#endif // ASYNCCALL_H
