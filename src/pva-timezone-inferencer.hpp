#pragma once

#include "pva-models.hpp"

#include <QVector>

namespace pva {

struct InferenceStats {
	int inferred = 0;
	int reassigned = 0;
};

// Propagates the most recent known UTC offset forward in capture order to
// records whose source did not carry one.
class TimezoneInferencer {
public:
	InferenceStats infer(const QVector<TimestampRecord *> &records) const;

	static bool apply_inferred_offset(TimestampRecord *record, int offset_minutes);
};

} // namespace pva
