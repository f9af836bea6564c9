#include "vical/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcApp, "vical.app")
Q_LOGGING_CATEGORY(lcStore, "vical.store")
Q_LOGGING_CATEGORY(lcInput, "vical.input")
