#ifndef hitbox3d_ConsoleProgressIndicator_hpp_
#define hitbox3d_ConsoleProgressIndicator_hpp_

#include <cstdio>
#include <string>

#include "Jobs/ProgressIndicator.hpp"

namespace Hitbox3D {

// Prints one line per progress change to a C stream.
class ConsoleProgressIndicator : public ProgressIndicator
{
public:
    explicit ConsoleProgressIndicator(FILE *out = stdout) : m_out(out) {}

    void clear_percent() override;
    void set_range(int range) override { m_range = range > 0 ? range : 100; }
    void set_cancel_callback(CancelFn fn = CancelFn()) override { m_cancel = std::move(fn); }
    void set_progress(int pr) override;
    void set_status_text(const char *text) override;
    int  get_range() const override { return m_range; }

    int  progress() const { return m_progress; }
    const std::string& status_text() const { return m_status; }

    // Forwards to the callback installed by the worker.
    void cancel();

private:
    void print() const;

    FILE        *m_out;
    int          m_range { 100 };
    int          m_progress { 0 };
    std::string  m_status;
    CancelFn     m_cancel;
};

} // namespace Hitbox3D

#endif // hitbox3d_ConsoleProgressIndicator_hpp_
