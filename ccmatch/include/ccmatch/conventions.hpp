#ifndef CCMATCH_CONVENTIONS_HPP
#define CCMATCH_CONVENTIONS_HPP

#include <ccmatch/table.hpp>
#include <string>
#include <vector>

namespace ccmatch {

/**
 * Column naming conventions of an EHR extract.
 * Passed to the engine explicitly so concurrent runs can use different ones.
 */
struct FieldConventions {
    std::string patient_id = "patid";

    std::vector<std::string> date_fields = {
        "eventdate", "sysdate", "lcd", "uts", "frd", "crd", "tod", "deathdate", "indexdate"
    };

    // Output columns added by the result assembler
    std::string case_id_field = "case_id";
    std::string match_id_field = "matchid";
    std::string case_indicator_field = "case";

    bool is_date_field(const std::string& column) const;
};

/**
 * Convert date columns to Date cells in place.
 *
 * Columns considered are those in conventions.date_fields plus `extras` that
 * exist in the table. ISO text and integer day counts are converted; NA and
 * empty strings become NA. Unparseable text raises ConfigurationError naming
 * the column and row. Returns the number of columns converted.
 */
std::size_t convert_dates(Table& table, const FieldConventions& conventions,
                          const std::vector<std::string>& extras = {});

/**
 * Replace Date cells of the date columns with integer days since `origin`.
 * The default origin is the Unix epoch; Stata-style exports use 1960-01-01.
 */
std::size_t compress_dates(Table& table, const FieldConventions& conventions,
                           const Date& origin = Date(0));

} // namespace ccmatch

#endif // CCMATCH_CONVENTIONS_HPP
