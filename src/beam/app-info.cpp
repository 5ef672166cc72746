#include "app-info.h"

using std::string;

const string appName = "Beam";
const string appVersion = BEAM_VERSION;
