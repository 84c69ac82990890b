#pragma once

// ============================================================================
// PageMap - Position correspondence between an old and a new version
// ============================================================================
// Part of the Folio versioning layer
//
// Every structural edit produces a list of (newNumber, oldNumber) pairs,
// both 1-based, telling the side-data replicator where each page of the new
// version came from. Entries are sorted by newNumber and cover every page of
// the new version exactly once.
//
// The builders are pure functions. Invalid input is rejected with an empty
// mapping and a message in the optional errorMessage out-parameter; nothing
// is ever clamped into range.
// ============================================================================

#include <QString>
#include <QVector>

/**
 * @brief Which version an entry's oldNumber refers to.
 */
enum class PageOrigin {
    Self,       ///< The edited document's previous version
    Source      ///< A foreign version the page was moved from
};

/**
 * @brief One position correspondence.
 */
struct PageMapEntry {
    int newNumber = 0;
    int oldNumber = 0;
    PageOrigin origin = PageOrigin::Self;

    bool operator==(const PageMapEntry& other) const
    {
        return newNumber == other.newNumber
            && oldNumber == other.oldNumber
            && origin == other.origin;
    }
    bool operator!=(const PageMapEntry& other) const { return !(*this == other); }
};

using PageMapping = QVector<PageMapEntry>;

/**
 * @brief Requested move of one page in a reorder.
 */
struct PageAssignment {
    int oldNumber = 0;
    int newNumber = 0;
};

namespace PageMap {

/**
 * @brief Map for deleting pages.
 *
 * Survivors keep their relative order and are renumbered from 1.
 * delete(total=5, deleted={3}) gives (1,1) (2,2) (3,4) (4,5).
 *
 * @param totalPages Page count of the old version.
 * @param deletedNumbers 1-based numbers to delete; duplicates are ignored.
 * @return Mapping, empty on invalid input or when every page would be deleted.
 */
PageMapping forDelete(int totalPages, const QVector<int>& deletedNumbers,
                      QString* errorMessage = nullptr);

/**
 * @brief Map for reordering pages.
 *
 * The assignments must cover every page: old numbers and new numbers must
 * each be exactly {1..totalPages}.
 *
 * @return Mapping sorted by new number, empty if not a permutation.
 */
PageMapping forReorder(int totalPages, const QVector<PageAssignment>& assignments,
                       QString* errorMessage = nullptr);

/**
 * @brief Identity map used by rotation.
 */
PageMapping forRotate(int totalPages);

/**
 * @brief Map for inserting foreign pages into a destination version.
 *
 * Destination pages 1..position keep their numbers, the inserted pages take
 * position+1..position+insertedCount (origin Source, old number taken from
 * sourceNumbers in order), and the remaining destination pages shift by
 * insertedCount.
 *
 * @param position Insert after this destination page, 0 inserts before the first.
 * @param sourceNumbers Page numbers in the source version, in insertion order.
 * @param destinationTotal Page count of the destination before the insert.
 */
PageMapping forInsert(int position, const QVector<int>& sourceNumbers, int destinationTotal,
                      QString* errorMessage = nullptr);

/**
 * @brief Map seeding a fresh document from foreign pages.
 *
 * New page i+1 maps to sourceNumbers[i] with origin Source.
 */
PageMapping fromSelection(const QVector<int>& sourceNumbers);

/**
 * @brief Inverse of a bijective map. Origins are kept.
 */
PageMapping inverted(const PageMapping& mapping);

/**
 * @brief True if old and new numbers each form {1..mapping.size()}.
 */
bool isBijection(const PageMapping& mapping);

/**
 * @brief Old numbers of the entries with the given origin, in new-number order.
 */
QVector<int> oldNumbers(const PageMapping& mapping, PageOrigin origin = PageOrigin::Self);

} // namespace PageMap
