#include "cusplit/MessageComposer.hpp"

#include "cusplit/TextNormalizer.hpp"

namespace cusplit {

namespace {

void replaceAll(std::string &text, const std::string &from,
                const std::string &to) {
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string compactTitle(const std::string &name) {
  std::string compact;
  for (char c : titleCase(name)) {
    if (c != ' ') {
      compact += c;
    }
  }
  return compact;
}

} // namespace

const char *const kDefaultSubjectTemplate = "Certificazione Unica {anno}";

std::string defaultBodyTemplate() {
  return "<p>Gentile {nome} {cognome},</p>"
         "<p>in allegato trova la Sua Certificazione Unica {anno}.</p>"
         "<p>Cordiali saluti</p>";
}

std::string renderTemplate(const std::string &templateText,
                           const CertificateRecord &record,
                           const std::string &defaultYear) {
  std::string rendered = templateText;
  replaceAll(rendered, "{nome}", titleCase(record.givenName));
  replaceAll(rendered, "{cognome}", titleCase(record.surname));
  replaceAll(rendered, "{anno}",
             record.hasTaxYear() ? std::to_string(record.taxYear) : defaultYear);
  return rendered;
}

std::string outputFilename(const CertificateRecord &record) {
  std::string name = "CU";
  if (record.hasTaxYear()) {
    name += std::to_string(record.taxYear);
  }

  bool anyField = false;
  for (const std::string &part :
       {compactTitle(record.surname), compactTitle(record.givenName),
        record.fiscalCode}) {
    if (!part.empty()) {
      name += "_" + part;
      anyField = true;
    }
  }

  if (!anyField) {
    name += "_" + record.id();
  }

  return name + ".pdf";
}

} // namespace cusplit
