#ifndef GF25519_SONAME_HPP
#define GF25519_SONAME_HPP

// Update the SONAME of the library whenever the ABI is changed in an
// incompatible way, for instance when the limb layout of Fe changes. This
// allows several versions of the library within the same executable
// program. Change it here and in CMakeLists.txt.
#define GF25519_SONAME v1

#if defined(_WIN32) || defined(__CYGWIN__)
	#define EXPORTFN __declspec(dllexport)
#elif defined(__GNUC__)
	#define EXPORTFN __attribute__((visibility("default")))
#else
	#define EXPORTFN
#endif


namespace gf25519 {
	inline namespace GF25519_SONAME {}
}


#endif
