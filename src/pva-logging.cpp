#include "pva-logging.hpp"

namespace pva {

Q_LOGGING_CATEGORY(lcTimestamp, "pva.timestamp")
Q_LOGGING_CATEGORY(lcTimezone, "pva.timezone")
Q_LOGGING_CATEGORY(lcAnnotations, "pva.annotations")
Q_LOGGING_CATEGORY(lcStore, "pva.store")
Q_LOGGING_CATEGORY(lcDuplicates, "pva.duplicates")
Q_LOGGING_CATEGORY(lcCatalog, "pva.catalog")

} // namespace pva
