#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "DislocTypes.hpp"
#include "ElasticConstants.hpp"
#include "DislocationGeometry.hpp"
#include "GammaSurface.hpp"
#include "VolterraDislocation.hpp"
#include "SDVPN.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace DislocCore {

/**
 * @brief INI-style configuration reader
 *
 * Describes a complete dislocation-core calculation (elastic constants,
 * dislocation geometry, gamma surface, slip-plane grid and solver) in a
 * single text file. Dimensional values accept units ("110 GPa",
 * "140 mJ/m^2") and are returned in working units (Å, eV).
 */
class ConfigReader {
public:
    struct GridConfig {
        double xmax;                    // Half length of the slip-plane grid (Å)
        int npoints;
        BoundaryCondition boundary;
        double initial_halfwidth;       // Arctan starting guess (Å)
        double initial_shift;           // Arctan center (Å)
    };

    struct OutputConfig {
        std::string profile_file;       // Empty: print to stdout
        int precision;
        bool write_density;
    };

    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    bool loadFile(const std::string& filename);
    bool mergeFile(const std::string& filename);

    // Insert or override one value
    void set(const std::string& section, const std::string& key, const std::string& value);

    // =========================================================================
    // Domain parsers
    // =========================================================================

    /**
     * @brief Stiffness from [ELASTIC]
     *
     * Moduli default to GPa when written without a unit.
     * @throws std::invalid_argument on missing constants
     * @throws IllConditionedElasticityError on an invalid tensor
     */
    ElasticConstants parseElasticConstants() const;

    /**
     * @brief Burgers vector, slip-plane normal and glide direction from [DISLOCATION]
     * @throws std::invalid_argument on missing or non-orthogonal vectors
     */
    DislocationGeometry parseDislocationGeometry() const;

    VolterraOptions parseVolterraOptions() const;

    /**
     * @brief Gamma surface from [GAMMA_SURFACE]
     *
     * model = sinusoidal builds (γ_us/2)(1 - cos 2π a1) from
     * unstable_fault_energy; model = table reads n1 * n2 comma-separated
     * energies. Lattice vectors are in the dislocation frame and default to
     * the in-plane Burgers vector and its in-plane normal.
     *
     * @param burgers_frame Burgers vector in the dislocation frame
     */
    GammaSurface parseGammaSurface(const Vector3& burgers_frame) const;

    bool parseGridConfig(GridConfig& config) const;
    bool parseSolverOptions(SDVPNOptions& options) const;
    bool parseOutputConfig(OutputConfig& config) const;

    // Applied stress in the dislocation frame from [SOLVER] applied_stress (Voigt, GPa)
    Matrix3 parseAppliedStress() const;

    // Diagonal gradient-energy coefficients from [SOLVER] surface_correction (eV/Å)
    Matrix3 parseSurfaceCorrection() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    /**
     * @brief Three comma-separated components
     * @throws std::invalid_argument if the key is present without three values
     */
    Vector3 getVector3(const std::string& section, const std::string& key,
                       const Vector3& default_val) const;

    // =========================================================================
    // Unit-Aware Value Accessors (converts to Å, eV)
    // =========================================================================

    /**
     * @brief Get double value with automatic unit conversion
     * @param default_val Default value (in working units)
     * @param default_unit Unit assumed when the value has none
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             double default_val = 0.0,
                             const std::string& default_unit = "") const;

    std::vector<double> getDoubleArrayWithUnit(const std::string& section,
                                               const std::string& key,
                                               const std::string& default_unit = "") const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;
    std::map<std::string, std::string> getSectionData(const std::string& section) const;

    static void generateTemplate(const std::string& filename);

    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
    UnitSystem unit_system_;

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace DislocCore

#endif // CONFIG_READER_HPP
