#ifndef _libhitbox3d_h_
#define _libhitbox3d_h_

#define HITBOX3D_APP_NAME "Hitbox3D"
#define HITBOX3D_APP_KEY "hitbox3d"
#define HITBOX3D_VERSION "1.0.0"
#define HITBOX3D_BUILD_ID HITBOX3D_APP_KEY "-" HITBOX3D_VERSION

namespace Hitbox3D {

// Seed of the cluster initialisation, fixed so that a mesh decomposes the same way every time.
static constexpr unsigned int DEFAULT_CLUSTER_SEED = 42;

// Number of medoid snap rounds following the Lloyd fit.
static constexpr int CLUSTER_REFINEMENT_ROUNDS = 3;

} // namespace Hitbox3D

#endif // _libhitbox3d_h_
