// Field class is a Kokkos::View-based data structure holding one named array
// of the simulation, typically one value per node or one value per link.
// It provides methods for initialization and data access.

#ifndef TVD_CORE_FIELD_HPP
#define TVD_CORE_FIELD_HPP

#include <Kokkos_Core.hpp>
#include <array>
#include <string>

namespace TVD {
namespace Core {

// Helper to create Kokkos::View of varying dimensions
template<size_t Dim, typename ScalarType = double>
struct ViewTypeHelper;

template<typename ScalarType> struct ViewTypeHelper<1, ScalarType> { using type = Kokkos::View<ScalarType*>; };
template<typename ScalarType> struct ViewTypeHelper<2, ScalarType> { using type = Kokkos::View<ScalarType**>; };

template<size_t Dim, typename ScalarType = double>
class Field {
public:
    using ViewType = typename ViewTypeHelper<Dim, ScalarType>::type;
    using HostMirrorType = typename ViewType::HostMirror;

    // Constructor
    explicit Field(const std::string& field_name, const std::array<int, Dim>& dims)
        : name_(field_name) {

        if constexpr (Dim == 1) data_ = ViewType(name_, dims[0]);
        else if constexpr (Dim == 2) data_ = ViewType(name_, dims[0], dims[1]);

        Kokkos::deep_copy(data_, ScalarType(0));
        Kokkos::fence();
    }

    ~Field() = default;

    // Delete copy constructor and assignment operator to prevent shallow copies
    Field(const Field&) = delete;
    Field& operator=(const Field&) = delete;

    // --- Initialization Methods (executed on device) ---

    void initialize_to_zero() {
        Kokkos::deep_copy(data_, ScalarType(0));
        Kokkos::fence();
    }

    void fill(ScalarType value) {
        Kokkos::deep_copy(data_, value);
        Kokkos::fence();
    }

    ViewType& get_mutable_device_data() { return data_; }
    const ViewType& get_device_data() const { return data_; }

    HostMirrorType get_host_data() const {
        HostMirrorType host_data = Kokkos::create_mirror_view(data_);
        Kokkos::deep_copy(host_data, data_);
        Kokkos::fence();
        return host_data;
    }

    void update_device_from_host(const HostMirrorType& host_data) {
        Kokkos::deep_copy(data_, host_data);
        Kokkos::fence();
    }

    const std::string& get_name() const { return name_; }
    int size() const { return static_cast<int>(data_.extent(0)); }

private:
    std::string name_; // Name of the field for identification
    ViewType data_;
};

} // namespace Core
} // namespace TVD

#endif // TVD_CORE_FIELD_HPP
