#include "ConsoleProgressIndicator.hpp"

namespace Hitbox3D {

void ConsoleProgressIndicator::clear_percent()
{
    m_progress = 0;
}

void ConsoleProgressIndicator::set_progress(int pr)
{
    if (pr == m_progress)
        return;
    m_progress = pr;
    this->print();
}

void ConsoleProgressIndicator::set_status_text(const char *text)
{
    std::string status = text ? text : "";
    if (status == m_status)
        return;
    m_status = std::move(status);
    this->print();
}

void ConsoleProgressIndicator::cancel()
{
    if (m_cancel)
        m_cancel();
}

void ConsoleProgressIndicator::print() const
{
    if (m_out == nullptr)
        return;
    int percent = m_range > 0 ? m_progress * 100 / m_range : m_progress;
    fprintf(m_out, "[%3d%%] %s\n", percent, m_status.c_str());
    fflush(m_out);
}

} // namespace Hitbox3D
