#include "scene.h"

#include <utility>

using boost::optional;
using std::string;
using std::vector;

Scene::Scene(string name, optional<seconds> declaredDuration, vector<SceneObject> objects) :
    name(std::move(name)),
    declaredDuration(declaredDuration),
    objects(std::move(objects)) {}

optional<size_t> Scene::findObjectIndex(const string& id) const {
    for (size_t i = 0; i < objects.size(); ++i) {
        if (objects[i].id == id) return i;
    }
    return boost::none;
}
