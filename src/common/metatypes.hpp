#pragma once

#include <QMetaType>

#include "common/models.hpp"

Q_DECLARE_METATYPE(nettrack::ChangeEvent)
Q_DECLARE_METATYPE(nettrack::ChangeScope)
