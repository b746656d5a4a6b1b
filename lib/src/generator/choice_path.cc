//
// Combinatorial odometer
//

#include <promptgen/generator.hh>

#include <algorithm>

namespace promptgen {
    std::size_t choice_path::choose(std::size_t count) {
        if (m_cursor < m_points.size()) {
            auto& p = m_points[m_cursor];
            if (p.count == count) {
                ++m_cursor;
                return p.index;
            }
            // The walk took another shape past this point: forget the stale suffix
            m_points.resize(m_cursor);
        }
        m_points.push_back(point{0, count});
        ++m_cursor;
        return 0;
    }

    bool choice_path::advance() {
        // Points beyond the cursor were not reached by the last render
        m_points.resize(std::min(m_cursor, m_points.size()));
        m_cursor = 0;

        while (!m_points.empty()) {
            auto& last = m_points.back();
            if (last.index + 1 < last.count) {
                ++last.index;
                return true;
            }
            m_points.pop_back();
        }
        return false;
    }

    void choice_path::reset() {
        m_points.clear();
        m_cursor = 0;
    }
}
