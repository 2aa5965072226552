#ifndef CUSPLIT_MESSAGE_COMPOSER_HPP
#define CUSPLIT_MESSAGE_COMPOSER_HPP

#include "cusplit/Records.hpp"

#include <string>

namespace cusplit {

/// Subject used when the caller does not supply one
extern const char *const kDefaultSubjectTemplate;

/// HTML body used when the caller does not supply one
std::string defaultBodyTemplate();

/**
 * @brief Substitute the record's fields into a message template
 *
 * Placeholders: {nome} and {cognome} (title case), {anno} (tax year, or
 * defaultYear when the record has none). Unknown placeholders are left as
 * they are.
 */
std::string renderTemplate(const std::string &templateText,
                           const CertificateRecord &record,
                           const std::string &defaultYear);

/**
 * @brief Name of the single-certificate PDF
 *
 * CU<year>_<Surname>_<GivenName>_<FiscalCode>.pdf with names title-cased and
 * their spaces removed. Absent parts are omitted with their separator; a
 * record with no field at all is named after its page range,
 * e.g. "CU_p3-5.pdf".
 */
std::string outputFilename(const CertificateRecord &record);

} // namespace cusplit

#endif // CUSPLIT_MESSAGE_COMPOSER_HPP
