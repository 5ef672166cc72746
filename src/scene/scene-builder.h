#pragma once

#include <boost/optional.hpp>

#include "core/camera.h"
#include "scene.h"
#include "script/parse-tree.h"

// Validates a scene declaration against the property schemas and fills in defaults.
// Throws a SchemaError or TimingError describing the first problem found.
Scene buildScene(const SceneDeclaration& declaration);

// Returns the default camera if none is declared. Unknown camera properties are logged and ignored.
Camera buildCamera(const boost::optional<CameraDeclaration>& declaration);
