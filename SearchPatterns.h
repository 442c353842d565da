#pragma once

#include <QList>
#include <QStringList>
#include "SsdpSearchParams.h"

namespace SearchPatterns {

QStringList defaultTargets();

// Candidate M-SEARCH header sets, most likely first
QList<SsdpSearchParams> generate(const QStringList &targets = defaultTargets());

}
