/**
 * @file MySQLResultSet.cpp
 * @brief Implementation of RAII MySQL result set wrapper.
 */

#include "MySQLResultSet.hpp"

namespace sqlreplay {

// ============================================================================
// Construction and Destruction
// ============================================================================

MySQLResultSet::MySQLResultSet(MYSQL_RES* res) : m_res(res) {}

MySQLResultSet::~MySQLResultSet() {
    if (m_res) {
        mysql_free_result(m_res);
    }
}

MySQLResultSet::MySQLResultSet(MySQLResultSet&& other) noexcept : m_res(other.m_res) {
    other.m_res = nullptr;
}

MySQLResultSet& MySQLResultSet::operator=(MySQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) {
            mysql_free_result(m_res);
        }
        m_res = other.m_res;
        other.m_res = nullptr;
    }
    return *this;
}

// ============================================================================
// Row and Field Access
// ============================================================================

MYSQL_ROW MySQLResultSet::fetchRow() {
    return m_res ? mysql_fetch_row(m_res) : nullptr;
}

unsigned int MySQLResultSet::numFields() const {
    return m_res ? mysql_num_fields(m_res) : 0;
}

std::vector<std::string> MySQLResultSet::getColumnNames() const {
    std::vector<std::string> names;
    if (!m_res) return names;

    unsigned int numFields = mysql_num_fields(m_res);
    MYSQL_FIELD* fields = mysql_fetch_fields(m_res);

    names.reserve(numFields);
    for (unsigned int i = 0; i < numFields; ++i) {
        names.emplace_back(fields[i].name);
    }

    return names;
}

Rows MySQLResultSet::toRows() {
    Rows rows;
    if (!m_res) return rows;

    rows.columns = getColumnNames();
    rows.rows.reserve(static_cast<size_t>(mysql_num_rows(m_res)));

    const unsigned int fieldCount = numFields();
    MYSQL_ROW row;
    while ((row = fetchRow())) {
        unsigned long* lengths = mysql_fetch_lengths(m_res);

        std::vector<std::optional<std::string>> cells;
        cells.reserve(fieldCount);
        for (unsigned int i = 0; i < fieldCount; ++i) {
            if (row[i]) {
                cells.emplace_back(std::string(row[i], lengths[i]));
            } else {
                cells.emplace_back(std::nullopt);
            }
        }
        rows.rows.push_back(std::move(cells));
    }

    return rows;
}

}  // namespace sqlreplay
