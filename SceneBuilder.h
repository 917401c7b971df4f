#ifndef SCENEBUILDER_H
#define SCENEBUILDER_H

#include <cstdint>
#include "parser.h"

// Ground sphere and one gray diffuse sphere in front of a camera at the
// origin looking down -Z.
SceneDescription BuildTwoSpheresScene();

// Ground, a (2n+1)^2 grid of small random spheres and three large feature
// spheres (glass, diffuse, polished metal). seed fixes the layout.
SceneDescription BuildRandomScene(int grid_half_extent, uint32_t seed);

#endif // SCENEBUILDER_H
