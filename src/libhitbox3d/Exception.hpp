#ifndef _libhitbox3d_Exception_h_
#define _libhitbox3d_Exception_h_

#include <stdexcept>
#include <string>

namespace Hitbox3D {

// Base for Hitbox3D's own exceptions.
class Exception : public std::runtime_error { using std::runtime_error::runtime_error; };
#define HITBOX3D_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { using PARENT_EXCEPTION::PARENT_EXCEPTION; }
// Exceptions below are reported to the caller of a job through its outcome, never thrown across the worker thread.
HITBOX3D_DERIVE_EXCEPTION(CriticalException,  Exception);
HITBOX3D_DERIVE_EXCEPTION(RuntimeError,       CriticalException);
HITBOX3D_DERIVE_EXCEPTION(LogicError,         CriticalException);
HITBOX3D_DERIVE_EXCEPTION(InvalidArgument,    LogicError);
HITBOX3D_DERIVE_EXCEPTION(OutOfRange,         LogicError);
// Mesh rejected before any clustering work starts.
HITBOX3D_DERIVE_EXCEPTION(InvalidMeshError,   RuntimeError);
// Numerical failure of the clustering backend.
HITBOX3D_DERIVE_EXCEPTION(ClusteringError,    RuntimeError);
// A decomposition was requested while another one is still running.
HITBOX3D_DERIVE_EXCEPTION(JobAlreadyRunning,  RuntimeError);
#undef HITBOX3D_DERIVE_EXCEPTION

// Thrown at a cancellation checkpoint. Not an error, the job ends as canceled.
class CanceledException : public std::exception
{
public:
    const char *what() const throw() override { return "Background processing has been canceled"; }
};

} // namespace Hitbox3D

#endif // _libhitbox3d_Exception_h_
