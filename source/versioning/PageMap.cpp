// ============================================================================
// PageMap - Implementation
// ============================================================================

#include "PageMap.h"

#include <QSet>

#include <algorithm>

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

bool isFullRange(const QVector<int>& numbers, int total)
{
    if (numbers.size() != total) {
        return false;
    }
    QVector<bool> seen(total, false);
    for (int n : numbers) {
        if (n < 1 || n > total || seen[n - 1]) {
            return false;
        }
        seen[n - 1] = true;
    }
    return true;
}

} // anonymous namespace

namespace PageMap {

PageMapping forDelete(int totalPages, const QVector<int>& deletedNumbers, QString* errorMessage)
{
    if (totalPages < 1) {
        setError(errorMessage, QStringLiteral("Version has no pages"));
        return {};
    }
    if (deletedNumbers.isEmpty()) {
        setError(errorMessage, QStringLiteral("No pages selected for deletion"));
        return {};
    }

    QSet<int> deleted;
    for (int n : deletedNumbers) {
        if (n < 1 || n > totalPages) {
            setError(errorMessage, QStringLiteral("Page number %1 is out of range 1..%2")
                                       .arg(n).arg(totalPages));
            return {};
        }
        deleted.insert(n);
    }
    if (deleted.size() >= totalPages) {
        setError(errorMessage, QStringLiteral("Document version must have at least one page"));
        return {};
    }

    PageMapping mapping;
    mapping.reserve(totalPages - deleted.size());
    int next = 1;
    for (int old = 1; old <= totalPages; ++old) {
        if (deleted.contains(old)) {
            continue;
        }
        mapping.append({next++, old, PageOrigin::Self});
    }
    return mapping;
}

PageMapping forReorder(int totalPages, const QVector<PageAssignment>& assignments,
                       QString* errorMessage)
{
    if (totalPages < 1) {
        setError(errorMessage, QStringLiteral("Version has no pages"));
        return {};
    }
    if (assignments.size() != totalPages) {
        setError(errorMessage, QStringLiteral("Reorder must list all %1 pages, got %2")
                                   .arg(totalPages).arg(assignments.size()));
        return {};
    }

    QVector<int> olds;
    QVector<int> news;
    for (const PageAssignment& a : assignments) {
        olds.append(a.oldNumber);
        news.append(a.newNumber);
    }
    if (!isFullRange(olds, totalPages)) {
        setError(errorMessage, QStringLiteral("Old page numbers are not a permutation of 1..%1")
                                   .arg(totalPages));
        return {};
    }
    if (!isFullRange(news, totalPages)) {
        setError(errorMessage, QStringLiteral("New page numbers are not a permutation of 1..%1")
                                   .arg(totalPages));
        return {};
    }

    PageMapping mapping;
    mapping.reserve(totalPages);
    for (const PageAssignment& a : assignments) {
        mapping.append({a.newNumber, a.oldNumber, PageOrigin::Self});
    }
    std::sort(mapping.begin(), mapping.end(),
              [](const PageMapEntry& a, const PageMapEntry& b) {
                  return a.newNumber < b.newNumber;
              });
    return mapping;
}

PageMapping forRotate(int totalPages)
{
    PageMapping mapping;
    for (int n = 1; n <= totalPages; ++n) {
        mapping.append({n, n, PageOrigin::Self});
    }
    return mapping;
}

PageMapping forInsert(int position, const QVector<int>& sourceNumbers, int destinationTotal,
                      QString* errorMessage)
{
    if (sourceNumbers.isEmpty()) {
        setError(errorMessage, QStringLiteral("No pages to insert"));
        return {};
    }
    if (destinationTotal < 0 || position < 0 || position > destinationTotal) {
        setError(errorMessage, QStringLiteral("Insert position %1 is out of range 0..%2")
                                   .arg(position).arg(destinationTotal));
        return {};
    }
    for (int n : sourceNumbers) {
        if (n < 1) {
            setError(errorMessage, QStringLiteral("Invalid source page number %1").arg(n));
            return {};
        }
    }

    const int inserted = static_cast<int>(sourceNumbers.size());
    PageMapping mapping;
    mapping.reserve(destinationTotal + inserted);

    // Before the insertion point
    for (int n = 1; n <= position; ++n) {
        mapping.append({n, n, PageOrigin::Self});
    }
    // Inserted range
    for (int i = 0; i < inserted; ++i) {
        mapping.append({position + 1 + i, sourceNumbers.at(i), PageOrigin::Source});
    }
    // After the insertion point, shifted
    for (int old = position + 1; old <= destinationTotal; ++old) {
        mapping.append({old + inserted, old, PageOrigin::Self});
    }
    return mapping;
}

PageMapping fromSelection(const QVector<int>& sourceNumbers)
{
    PageMapping mapping;
    mapping.reserve(sourceNumbers.size());
    for (int i = 0; i < sourceNumbers.size(); ++i) {
        mapping.append({i + 1, sourceNumbers.at(i), PageOrigin::Source});
    }
    return mapping;
}

PageMapping inverted(const PageMapping& mapping)
{
    PageMapping result;
    result.reserve(mapping.size());
    for (const PageMapEntry& e : mapping) {
        result.append({e.oldNumber, e.newNumber, e.origin});
    }
    std::sort(result.begin(), result.end(),
              [](const PageMapEntry& a, const PageMapEntry& b) {
                  return a.newNumber < b.newNumber;
              });
    return result;
}

bool isBijection(const PageMapping& mapping)
{
    QVector<int> olds;
    QVector<int> news;
    for (const PageMapEntry& e : mapping) {
        olds.append(e.oldNumber);
        news.append(e.newNumber);
    }
    const int total = static_cast<int>(mapping.size());
    return isFullRange(olds, total) && isFullRange(news, total);
}

QVector<int> oldNumbers(const PageMapping& mapping, PageOrigin origin)
{
    QVector<int> result;
    for (const PageMapEntry& e : mapping) {
        if (e.origin == origin) {
            result.append(e.oldNumber);
        }
    }
    return result;
}

} // namespace PageMap
