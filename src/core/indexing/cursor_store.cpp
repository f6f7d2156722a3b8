#include "core/indexing/cursor_store.h"

namespace cw {

FileCursor CursorStore::cursor(const QString& path) const
{
    return m_cursors.value(path);
}

bool CursorStore::contains(const QString& path) const
{
    return m_cursors.contains(path);
}

void CursorStore::advance(const QString& path, qint64 offset, int lineNo)
{
    FileCursor& entry = m_cursors[path];
    entry.offset = offset;
    entry.lineNo = lineNo;
}

void CursorStore::reset(const QString& path)
{
    m_cursors.insert(path, FileCursor{});
}

void CursorStore::erase(const QString& path)
{
    m_cursors.remove(path);
}

void CursorStore::clear()
{
    m_cursors.clear();
}

int CursorStore::size() const
{
    return static_cast<int>(m_cursors.size());
}

} // namespace cw
