/*=============================================================================

  DIVSIM - Diversification simulator
  Extendable array

=============================================================================*/

#ifndef DIVSIM_EXTEND_ARRAY_H
#define DIVSIM_EXTEND_ARRAY_H


namespace divsim {


// An array that grows geometrically as values are appended.
// Capacity can be reserved up front so that steady appends do not
// reallocate.
template <class ValueType>
class ExtendArray
{
public:
    ExtendArray(int _size=0, int _capacity=0, int _minsize=40) :
        data(NULL),
        len(_size),
        datalen(_capacity),
        minsize(_minsize)
    {
        if (datalen < len)
            datalen = len;
        if (datalen < minsize)
            datalen = minsize;
        data = new ValueType [datalen];
    }

    ExtendArray(const ExtendArray &other) :
        data(NULL),
        len(other.len),
        datalen(other.datalen),
        minsize(other.minsize)
    {
        data = new ValueType [datalen];
        for (int i=0; i<len; i++)
            data[i] = other.data[i];
    }

    ~ExtendArray()
    {
        delete [] data;
    }

    ExtendArray &operator=(const ExtendArray &other)
    {
        if (this == &other)
            return *this;
        ensureCapacity(other.len);
        for (int i=0; i<other.len; i++)
            data[i] = other.data[i];
        len = other.len;
        return *this;
    }


    //=========================================================================
    // capacity management

    bool ensureCapacity(int needed)
    {
        if (needed <= datalen && data != NULL)
            return true;

        int newsize = (datalen > minsize) ? datalen : minsize;
        if (newsize < 1)
            newsize = 1;
        while (newsize < needed)
            newsize *= 2;

        ValueType *tmp = new ValueType [newsize];
        for (int i=0; i<len; i++)
            tmp[i] = data[i];
        delete [] data;

        data = tmp;
        datalen = newsize;
        return true;
    }


    //=========================================================================
    // data access

    void append(const ValueType &val)
    {
        ensureCapacity(len + 1);
        data[len++] = val;
    }

    void clear()
    {
        len = 0;
    }

    inline ValueType &operator[](const int i)
    {
        return data[i];
    }

    inline const ValueType &operator[](const int i) const
    {
        return data[i];
    }

    inline ValueType *get() { return data; }
    inline const ValueType *get() const { return data; }

    inline int size() const { return len; }
    inline int capacity() const { return datalen; }


protected:
    ValueType *data;
    int len;
    int datalen;
    int minsize;
};


} // namespace divsim

#endif // DIVSIM_EXTEND_ARRAY_H
