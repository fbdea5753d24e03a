#pragma once

#include <exception>
#include <sstream>
#include <string>
#include <vector>

namespace pcflow {

// ============================================================================
// Base pcflow exception
// ============================================================================

class PcflowError : public std::exception {
  public:
    explicit PcflowError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override { return message_.c_str(); }

    const std::string &message() const { return message_; }

  protected:
    std::string message_;
};

// ============================================================================
// Region graph errors
// ============================================================================

class MalformedRegionGraphError : public PcflowError {
  public:
    explicit MalformedRegionGraphError(const std::string &message)
        : PcflowError("MalformedRegionGraphError: " + message) {}

    static MalformedRegionGraphError empty_scope(const std::string &node) {
        return MalformedRegionGraphError("the scope of " + node +
                                         " must not be empty");
    }

    static MalformedRegionGraphError unknown_node(size_t id) {
        return MalformedRegionGraphError("no node with id " +
                                         std::to_string(id));
    }

    static MalformedRegionGraphError bad_edge(const std::string &details) {
        return MalformedRegionGraphError("invalid edge: " + details);
    }

    static MalformedRegionGraphError bad_partition(const std::string &details) {
        return MalformedRegionGraphError("invalid partition: " + details);
    }

    static MalformedRegionGraphError bad_region(const std::string &details) {
        return MalformedRegionGraphError("invalid region: " + details);
    }
};

// ============================================================================
// Shape-related errors
// ============================================================================

class ShapeError : public PcflowError {
  public:
    explicit ShapeError(const std::string &message)
        : PcflowError("ShapeError: " + message) {}

    template <typename Container>
    static ShapeError mismatch(const Container &expected,
                               const Container &got) {
        std::ostringstream oss;
        oss << "expected shape [";
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << expected[i];
        }
        oss << "] but got [";
        for (size_t i = 0; i < got.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << got[i];
        }
        oss << "]";
        return ShapeError(oss.str());
    }

    static ShapeError rank_mismatch(size_t expected, size_t got) {
        return ShapeError("expected rank " + std::to_string(expected) +
                          " but got " + std::to_string(got));
    }

    static ShapeError invalid_axis(int axis, size_t ndim) {
        return ShapeError("axis " + std::to_string(axis) +
                          " out of bounds for parameter with " +
                          std::to_string(ndim) + " dimensions");
    }
};

// ============================================================================
// Value-related errors
// ============================================================================

class ValueError : public PcflowError {
  public:
    explicit ValueError(const std::string &message)
        : PcflowError("ValueError: " + message) {}

    static ValueError invalid_rule(const std::string &details) {
        return ValueError("not a valid operator rule: " + details);
    }

    static ValueError operands_not_first() {
        return ValueError("the layer operands of an operator rule must be "
                          "its first parameters");
    }

    static ValueError not_in_scope(const std::string &what) {
        return ValueError(what + " is not a subset of the circuit scope");
    }
};

// ============================================================================
// Operator registry lookup errors
// ============================================================================

class OperatorNotFound : public PcflowError {
  public:
    explicit OperatorNotFound(const std::string &op)
        : PcflowError("OperatorNotFound: symbolic operator named '" + op +
                      "' not found"),
          op_(op) {}

    const std::string &op() const { return op_; }

  private:
    std::string op_;
};

class OperatorSignatureNotFound : public PcflowError {
  public:
    explicit OperatorSignatureNotFound(const std::vector<std::string> &sig)
        : PcflowError("OperatorSignatureNotFound: symbolic operator for "
                      "signature (" +
                      join(sig) + ") not found"),
          signature_(sig) {}

    const std::vector<std::string> &signature() const { return signature_; }

  private:
    static std::string join(const std::vector<std::string> &parts) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0)
                out += ", ";
            out += parts[i];
        }
        return out;
    }

    std::vector<std::string> signature_;
};

// ============================================================================
// Cycle errors
// ============================================================================

class CycleError : public PcflowError {
  public:
    explicit CycleError(const std::string &message)
        : PcflowError("CycleError: " + message) {}
};

// A cycle among the circuits of a pipeline (a user pipeline error).
class PipelineCycleError : public CycleError {
  public:
    PipelineCycleError()
        : CycleError("the given pipeline of symbolic circuits has at least "
                     "one cycle") {}
};

// A cycle among the layers of one circuit (a circuit construction bug).
class LayerCycleError : public CycleError {
  public:
    LayerCycleError()
        : CycleError("the layers of the symbolic circuit have at least one "
                     "cycle") {}
};

// ============================================================================
// Structural errors
// ============================================================================

class StructuralError : public PcflowError {
  public:
    explicit StructuralError(const std::string &message)
        : PcflowError("StructuralError: " + message) {}

    static StructuralError unsupported_layer(const std::string &kind,
                                             const std::string &where) {
        return StructuralError("unsupported layer kind '" + kind + "' in " +
                               where);
    }

    static StructuralError incompatible(const std::string &details) {
        return StructuralError("incompatible circuits: " + details);
    }
};

// ============================================================================
// Runtime/internal errors
// ============================================================================

class RuntimeError : public PcflowError {
  public:
    explicit RuntimeError(const std::string &message)
        : PcflowError("RuntimeError: " + message) {}

    static RuntimeError not_implemented(const std::string &feature) {
        return RuntimeError(feature + " is not yet implemented");
    }

    static RuntimeError internal(const std::string &details) {
        return RuntimeError("internal error: " + details);
    }
};

// ============================================================================
// Serialization errors
// ============================================================================

class SerializationError : public PcflowError {
  public:
    explicit SerializationError(const std::string &message)
        : PcflowError("SerializationError: " + message) {}
};

class FileFormatError : public SerializationError {
  public:
    explicit FileFormatError(const std::string &message)
        : SerializationError("invalid file format: " + message) {}
};

} // namespace pcflow
