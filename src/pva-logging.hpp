#pragma once

#include <QLoggingCategory>

namespace pva {

Q_DECLARE_LOGGING_CATEGORY(lcTimestamp)
Q_DECLARE_LOGGING_CATEGORY(lcTimezone)
Q_DECLARE_LOGGING_CATEGORY(lcAnnotations)
Q_DECLARE_LOGGING_CATEGORY(lcStore)
Q_DECLARE_LOGGING_CATEGORY(lcDuplicates)
Q_DECLARE_LOGGING_CATEGORY(lcCatalog)

} // namespace pva
